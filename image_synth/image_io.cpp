#include <stdexcept>

#include "image_io.hpp"

using namespace std;
using namespace cv;

Mat loadImage(const string &fileName)
{
	Mat image = imread(fileName, IMREAD_UNCHANGED);
	if (image.empty())
		throw runtime_error("Could not read image " + fileName);

	// 16 bit PNGs show up now and then
	if (image.depth() == CV_16U)
		image.convertTo(image, CV_8U, 1.0 / 257.0);
	else if (image.depth() != CV_8U)
		throw runtime_error("Unsupported pixel depth in " + fileName);

	return image;
}

void saveImage(const string &fileName, const Mat &image)
{
	bool written = false;
	try
	{
		written = imwrite(fileName, image);
	}
	catch (const cv::Exception &e)
	{
		throw runtime_error("Could not write file " + fileName + " : " + e.what());
	}
	if (!written)
		throw runtime_error("Could not write file " + fileName);
}

Mat toBGRA(const Mat &image)
{
	Mat bgra;
	switch (image.channels())
	{
		case 1:
			cvtColor(image, bgra, COLOR_GRAY2BGRA);
			break;
		case 3:
			cvtColor(image, bgra, COLOR_BGR2BGRA);
			break;
		case 4:
			bgra = image.clone();
			break;
		default:
			throw invalid_argument("toBGRA : unsupported channel count");
	}
	return bgra;
}
