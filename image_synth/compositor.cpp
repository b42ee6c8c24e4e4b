#include <sstream>

#include "compositor.hpp"
#include "image_io.hpp"
#include "synth_errors.hpp"

using namespace std;
using namespace cv;

Compositor::Compositor(const Size &outputSize, int alphaThreshold) :
	outputSize_(outputSize),
	alphaThreshold_(alphaThreshold)
{
	if ((outputSize.width <= 0) || (outputSize.height <= 0))
		throw ConfigError("output size must be positive");
	if ((alphaThreshold < 0) || (alphaThreshold > 255))
		throw ConfigError("alpha threshold must be in the range 0-255");
}

CompositeResult Compositor::compose(const Mat &background,
									const vector<ForegroundLayer> &layers,
									RNG &rng,
									const string &backgroundName) const
{
	CompositeResult result;
	Mat canvas  = cropBackground(background, rng, backgroundName);
	result.mask = blankMask();

	for (auto it = layers.cbegin(); it != layers.cend(); ++it)
	{
		Rect where = placeForeground(it->image.size(), rng, it->name);
		pasteForeground(canvas, result.mask, it->image, where.tl(), it->color, it->name);
		result.placements.push_back(where);
	}

	result.composite = flattenAlpha(canvas);
	return result;
}

Mat Compositor::cropBackground(const Mat &background, RNG &rng, const string &backgroundName) const
{
	const int maxX = background.cols - outputSize_.width;
	const int maxY = background.rows - outputSize_.height;
	if ((maxX < 0) || (maxY < 0))
	{
		stringstream ss;
		ss << "desired size " << outputSize_.width << "x" << outputSize_.height
		   << " is larger than background size " << background.cols << "x" << background.rows
		   << " for " << (backgroundName.empty() ? "<unnamed background>" : backgroundName);
		throw BackgroundTooSmallError(ss.str());
	}

	// uniform() is exclusive of the upper bound
	const Point tl(rng.uniform(0, maxX + 1), rng.uniform(0, maxY + 1));
	return toBGRA(background(Rect(tl, outputSize_)));
}

Rect Compositor::placeForeground(const Size &fgSize, RNG &rng, const string &name) const
{
	const int maxX = outputSize_.width - fgSize.width;
	const int maxY = outputSize_.height - fgSize.height;
	if ((maxX < 0) || (maxY < 0))
	{
		stringstream ss;
		ss << "foreground " << (name.empty() ? "<unnamed>" : name)
		   << " is too big (" << fgSize.width << "x" << fgSize.height
		   << ") for the requested output size (" << outputSize_.width << "x" << outputSize_.height
		   << "), check your input parameters";
		throw ForegroundTooLargeError(ss.str());
	}

	return Rect(Point(rng.uniform(0, maxX + 1), rng.uniform(0, maxY + 1)), fgSize);
}

void Compositor::pasteForeground(Mat &canvas, Mat &mask,
								 const Mat &foreground, const Point &offset,
								 const InstanceColor &color,
								 const string &name) const
{
	CV_Assert(canvas.type() == CV_8UC4);
	CV_Assert(mask.type() == CV_8UC3);
	CV_Assert(canvas.size() == mask.size());
	if (foreground.type() != CV_8UC4)
		throw InvalidForegroundError("foreground must be 4 channel BGRA: " + name);

	const Rect fgRect(offset, foreground.size());
	if ((fgRect & Rect(Point(0, 0), canvas.size())) != fgRect)
	{
		stringstream ss;
		ss << "foreground " << (name.empty() ? "<unnamed>" : name)
		   << " at " << fgRect << " does not fit in " << canvas.cols << "x" << canvas.rows;
		throw ForegroundTooLargeError(ss.str());
	}

	const Vec3b maskColor = color.toBGR();
	for (int y = 0; y < foreground.rows; y++)
	{
		const Vec4b *ptrFg     = foreground.ptr<Vec4b>(y);
		      Vec4b *ptrCanvas = canvas.ptr<Vec4b>(y + offset.y) + offset.x;
		      Vec3b *ptrMask   = mask.ptr<Vec3b>(y + offset.y) + offset.x;
		for (int x = 0; x < foreground.cols; x++)
		{
			const uchar fgAlpha = ptrFg[x][3];

			// Later layers overwrite the mask of earlier ones
			if (fgAlpha > alphaThreshold_)
				ptrMask[x] = maskColor;

			if (fgAlpha == 0)
				continue;
			if (fgAlpha == 255)
			{
				ptrCanvas[x] = ptrFg[x];
				continue;
			}

			// Porter-Duff "over"
			const double fa  = fgAlpha / 255.;
			const double ba  = ptrCanvas[x][3] / 255.;
			const double bw  = ba * (1. - fa);
			const double out = fa + bw;
			for (int c = 0; c < 3; c++)
				ptrCanvas[x][c] = saturate_cast<uchar>((ptrFg[x][c] * fa + ptrCanvas[x][c] * bw) / out);
			ptrCanvas[x][3] = saturate_cast<uchar>(out * 255.);
		}
	}
}

Mat Compositor::blankMask(void) const
{
	return Mat::zeros(outputSize_, CV_8UC3);
}

Mat flattenAlpha(const Mat &bgra)
{
	Mat bgr;
	cvtColor(bgra, bgr, COLOR_BGRA2BGR);
	return bgr;
}
