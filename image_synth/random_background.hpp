#pragma once
#include <memory>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

// Picks a random image from a list of background files. Each image
// is loaded the first time it is picked and reused after that.
class RandomBackground
{
	public:
		explicit RandomBackground(const std::vector<std::string> &fileNames);

		// Returns the picked image (BGR or BGRA) and its file name.
		// Throws std::runtime_error if the image can't be decoded
		cv::Mat get(cv::RNG &rng, std::string &fileName);

		size_t size(void) const { return fileNames_.size(); }

	private:
		std::vector<std::string> fileNames_;
		std::vector<std::shared_ptr<cv::Mat>> images_;
};
