#include "mask_decompose.hpp"

using namespace std;
using namespace cv;

static Vec3b pixelAt(const Mat &mask, int y, int x)
{
	switch (mask.channels())
	{
		case 1:
			{
				const uchar v = mask.ptr<uchar>(y)[x];
				return Vec3b(v, v, v);
			}
		case 3:
			return mask.ptr<Vec3b>(y)[x];
		default:
			{
				const Vec4b &p = mask.ptr<Vec4b>(y)[x];
				return Vec3b(p[0], p[1], p[2]);
			}
	}
}

IsolatedMasks decomposeMask(const Mat &mask)
{
	IsolatedMasks isolated;
	if (mask.empty() || (mask.depth() != CV_8U))
		return isolated;
	const int channels = mask.channels();
	if ((channels != 1) && (channels != 3) && (channels != 4))
		return isolated;

	const Size paddedSize(mask.cols + 2 * MASK_PADDING, mask.rows + 2 * MASK_PADDING);

	// Cache the last bitmap used - neighboring pixels are
	// almost always the same color
	InstanceColor lastColor;
	Mat *lastBitmap = NULL;
	for (int y = 0; y < mask.rows; y++)
	{
		for (int x = 0; x < mask.cols; x++)
		{
			const Vec3b bgr = pixelAt(mask, y, x);
			if ((bgr[0] == 0) && (bgr[1] == 0) && (bgr[2] == 0))
				continue;

			const InstanceColor color = InstanceColor::fromBGR(bgr);
			if ((lastBitmap == NULL) || (color != lastColor))
			{
				auto it = isolated.find(color);
				if (it == isolated.end())
					it = isolated.insert(make_pair(color, Mat::zeros(paddedSize, CV_8UC1))).first;
				lastColor  = color;
				lastBitmap = &it->second;
			}
			lastBitmap->at<uchar>(y + MASK_PADDING, x + MASK_PADDING) = 1;
		}
	}
	return isolated;
}
