#pragma once

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

// A flat RGB color identifying one object instance in a mask image.
// (0,0,0) is reserved for background.
// Colors are compared directly; the "(R, G, B)" string form is
// only used when reading or writing JSON.
class InstanceColor
{
	public:
		InstanceColor(void);
		InstanceColor(int r, int g, int b);

		int r(void) const { return r_; }
		int g(void) const { return g_; }
		int b(void) const { return b_; }

		bool isBackground(void) const;

		// Canonical key, e.g. "(255, 0, 0)"
		std::string key(void) const;

		// Parse "(R, G, B)", whitespace optional. Returns false
		// if str isn't a valid key
		static bool fromKey(const std::string &str, InstanceColor &color);

		// OpenCV pixel order
		cv::Vec3b toBGR(void) const;
		cv::Scalar toScalar(void) const;
		static InstanceColor fromBGR(const cv::Vec3b &bgr);

		bool operator==(const InstanceColor &other) const;
		bool operator!=(const InstanceColor &other) const;
		bool operator<(const InstanceColor &other) const;

	private:
		int r_;
		int g_;
		int b_;
};

std::ostream &operator<<(std::ostream &os, const InstanceColor &color);

// Red, green, blue - one per simultaneous foreground
std::vector<InstanceColor> defaultPalette(void);
