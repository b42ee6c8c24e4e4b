#pragma once

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "instance_color.hpp"

// One already-transformed foreground waiting to be pasted
struct ForegroundLayer
{
	cv::Mat       image; // CV_8UC4 BGRA
	InstanceColor color; // flat color used for this instance in the mask
	std::string   name;  // source file, for error messages
};

struct CompositeResult
{
	cv::Mat composite; // CV_8UC3, alpha dropped
	cv::Mat mask;      // CV_8UC3, background exactly (0,0,0)
	std::vector<cv::Rect> placements; // where each layer landed, in paste order
};

// Builds a synthetic image by pasting foregrounds onto a random
// crop of a background, painting each foreground's opaque pixels
// into an instance mask at the same time.
//
// Layers are pasted in list order and later layers cover earlier
// ones - both in the composite and in the mask. A pixel of the mask
// always holds the color of the last layer that was opaque there, so
// partially or fully hidden objects lose (some or all of) their mask
// area just like they lose their visible pixels.
class Compositor
{
	public:
		Compositor(const cv::Size &outputSize, int alphaThreshold = 200);

		// Crop, paste every layer at a random position, flatten.
		// Throws BackgroundTooSmallError / ForegroundTooLargeError
		CompositeResult compose(const cv::Mat &background,
								const std::vector<ForegroundLayer> &layers,
								cv::RNG &rng,
								const std::string &backgroundName = std::string()) const;

		// Random outputSize window of background, as BGRA
		cv::Mat cropBackground(const cv::Mat &background, cv::RNG &rng,
							   const std::string &backgroundName = std::string()) const;

		// Random position at which a foreground of size fgSize fits
		// completely inside the output
		cv::Rect placeForeground(const cv::Size &fgSize, cv::RNG &rng,
								 const std::string &name = std::string()) const;

		// Alpha blend foreground over canvas (both BGRA) with its top
		// left corner at offset, and mark pixels above the alpha
		// threshold in mask (BGR) with color
		void pasteForeground(cv::Mat &canvas, cv::Mat &mask,
							 const cv::Mat &foreground, const cv::Point &offset,
							 const InstanceColor &color,
							 const std::string &name = std::string()) const;

		// Empty instance mask matching the output size
		cv::Mat blankMask(void) const;

	private:
		cv::Size outputSize_;
		int      alphaThreshold_;
};

// Drop the alpha channel of a BGRA image
cv::Mat flattenAlpha(const cv::Mat &bgra);
