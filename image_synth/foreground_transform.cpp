#include <algorithm>
#include <cmath>
#include <vector>

#include "foreground_transform.hpp"
#include "synth_errors.hpp"

using namespace std;
using namespace cv;

ForegroundTransformer::ForegroundTransformer(const TransformParams &params) :
	params_(params)
{
}

Mat ForegroundTransformer::transform(const Mat &cutout, RNG &rng, const string &name) const
{
	if ((cutout.type() != CV_8UC4) || !hasTransparency(cutout))
	{
		throw InvalidForegroundError("foreground needs to have some transparency: " +
				(name.empty() ? string("<unnamed>") : name));
	}

	// Each transform gets its own draw so the three are
	// independent of each other
	const double angle      = rng.uniform(params_.minAngle, params_.maxAngle);
	const double scale      = rng.uniform(params_.minScale, params_.maxScale);
	const double brightness = rng.uniform(params_.minBrightness, params_.maxBrightness);

	Mat rotated = rotateExpand(cutout, angle);
	Mat scaled  = scaleImage(rotated, scale);
	return adjustBrightness(scaled, brightness);
}

bool hasTransparency(const Mat &cutout)
{
	if (cutout.empty() || (cutout.channels() != 4))
		return false;

	Mat alpha;
	extractChannel(cutout, alpha, 3);
	return countNonZero(alpha == 0) > 0;
}

Mat rotateExpand(const Mat &src, double angle)
{
	const double rad  = angle * CV_PI / 180.;
	const double absC = fabs(cos(rad));
	const double absS = fabs(sin(rad));

	// Size of the bounding box of the rotated image. Knock a
	// tiny bit off before rounding up so e.g. a 90 degree rotation
	// doesn't pick up an extra row from floating point noise
	const int width  = max(1, (int)ceil(src.cols * absC + src.rows * absS - 1e-6));
	const int height = max(1, (int)ceil(src.cols * absS + src.rows * absC - 1e-6));

	const Point2f center(src.cols / 2.0f, src.rows / 2.0f);
	Mat rot = getRotationMatrix2D(center, angle, 1.0);

	// Shift so the rotated content is centered in the larger canvas
	rot.at<double>(0, 2) += width / 2.0 - center.x;
	rot.at<double>(1, 2) += height / 2.0 - center.y;

	Mat dst;
	warpAffine(src, dst, rot, Size(width, height), INTER_CUBIC, BORDER_CONSTANT, Scalar::all(0));
	return dst;
}

Mat scaleImage(const Mat &src, double scale)
{
	const Size size(max(1, (int)(src.cols * scale)),
					max(1, (int)(src.rows * scale)));
	if (size == src.size())
		return src.clone();

	Mat dst;
	resize(src, dst, size, 0, 0, INTER_CUBIC);
	return dst;
}

Mat adjustBrightness(const Mat &src, double factor)
{
	vector<Mat> channels;
	split(src, channels);

	// convertTo saturates, so brightening can't wrap around
	const int colorChannels = min(3, (int)channels.size());
	for (int i = 0; i < colorChannels; i++)
		channels[i].convertTo(channels[i], -1, factor, 0);

	Mat dst;
	merge(channels, dst);
	return dst;
}
