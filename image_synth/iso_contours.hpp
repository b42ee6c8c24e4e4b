#pragma once

#include <vector>

#include <opencv2/opencv.hpp>

// A traced contour as a list of (row, col) positions. Closed
// contours repeat their first point at the end.
typedef std::vector<cv::Vec2d> IsoContour;

// Marching squares. Returns every iso-line of image at value
// level, with edge crossings linearly interpolated between
// pixel centers.
//
// Values above level are "high". Where a square of pixels is
// ambiguous (high values on one diagonal only) the low pixels are
// treated as connected, so high regions only join through shared
// sides. Every contour is oriented so the low side lies to the left
// when walking it in (row, col) space - exterior boundaries of high
// regions and hole boundaries therefore wind in opposite directions.
//
// image can be any single channel type; it is converted to double.
std::vector<IsoContour> findIsoContours(const cv::Mat &image, double level);
