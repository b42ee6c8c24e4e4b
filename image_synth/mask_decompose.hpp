#pragma once

#include <map>

#include <opencv2/opencv.hpp>

#include "instance_color.hpp"

// Padding added around each isolated mask. Contour tracing at 0.5
// can't close a contour which runs into the edge of the image, so
// each bitmap gets a border of 0s
const int MASK_PADDING = 1;

// One CV_8UC1 bitmap of 0s and 1s per instance color, each
// (cols + 2) x (rows + 2) with the mask pixel (x, y) stored at
// (x + 1, y + 1)
typedef std::map<InstanceColor, cv::Mat> IsolatedMasks;

// Split a color-coded instance mask (BGR, 8 bit) into one binary
// bitmap per non-black color. 1 channel masks are read as gray,
// a 4th channel is ignored. Anything else gives an empty result.
IsolatedMasks decomposeMask(const cv::Mat &mask);
