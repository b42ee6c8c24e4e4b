#pragma once

#include <string>

#include <opencv2/opencv.hpp>

// Read an image as stored on disk (keeping any alpha channel),
// converted to 8 bits per channel. Throws std::runtime_error
// naming the file if it can't be decoded.
cv::Mat loadImage(const std::string &fileName);

// Write an image, throwing std::runtime_error if the encoder fails
void saveImage(const std::string &fileName, const cv::Mat &image);

// Convert a 1, 3 or 4 channel 8 bit image to BGRA.
// Images without alpha come back fully opaque.
cv::Mat toBGRA(const cv::Mat &image);
