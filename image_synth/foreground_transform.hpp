#pragma once

#include <string>

#include <opencv2/opencv.hpp>

// Ranges the random transforms are drawn from
struct TransformParams
{
	double minAngle      = 0.0;   // degrees
	double maxAngle      = 360.0;
	double minScale      = 0.5;
	double maxScale      = 1.0;
	double minBrightness = 0.7;
	double maxBrightness = 1.1;
};

// Randomly rotates, scales and brightens a foreground cutout
// before it is pasted onto a background.
class ForegroundTransformer
{
	public:
		explicit ForegroundTransformer(const TransformParams &params = TransformParams());

		// cutout must be CV_8UC4 (BGRA) with at least one fully
		// transparent pixel, else InvalidForegroundError is thrown.
		// name is only used in error messages.
		// Draws, in order, an angle, a scale and a brightness
		// factor from rng.
		cv::Mat transform(const cv::Mat &cutout, cv::RNG &rng,
						  const std::string &name = std::string()) const;

	private:
		TransformParams params_;
};

bool hasTransparency(const cv::Mat &cutout);

// Rotate counter-clockwise by angle degrees, growing the canvas so
// none of the rotated image is cut off. Added area is transparent.
cv::Mat rotateExpand(const cv::Mat &src, double angle);

// Resize both axes by scale. Sides never drop below 1 pixel
cv::Mat scaleImage(const cv::Mat &src, double scale);

// Multiply the color channels by factor, leaving alpha alone
cv::Mat adjustBrightness(const cv::Mat &src, double factor);
