#include <cmath>

#include "iso_contours.hpp"

using namespace std;
using namespace cv;

namespace
{
enum CellEdge { TOP, BOTTOM, LEFT, RIGHT };
enum CellCorner { UL, UR, LL, LR };

// Piece of contour crossing a single 2x2 square of pixels,
// running from one edge crossing to another
struct Segment
{
	long  startEdge;
	long  endEdge;
	Vec2d start;
	Vec2d end;
};

// The 2x2 neighborhood with top left pixel at (r, c)
class Cell
{
	public:
		Cell(const Mat &image, int r, int c, double level) :
			r_(r),
			c_(c),
			cols_(image.cols),
			level_(level)
		{
			ul_ = image.at<double>(r, c);
			ur_ = image.at<double>(r, c + 1);
			ll_ = image.at<double>(r + 1, c);
			lr_ = image.at<double>(r + 1, c + 1);
		}

		bool valid(void) const
		{
			return !cvIsNaN(ul_) && !cvIsNaN(ur_) && !cvIsNaN(ll_) && !cvIsNaN(lr_);
		}

		int squareCase(void) const
		{
			int sc = 0;
			if (ul_ > level_) sc |= 1;
			if (ur_ > level_) sc |= 2;
			if (ll_ > level_) sc |= 4;
			if (lr_ > level_) sc |= 8;
			return sc;
		}

		// Add the segment joining the crossings on edges e1 and e2.
		// ref is a corner on a known side of the segment; it is
		// used to orient the segment so low values sit on its left
		void addSegment(CellEdge e1, CellEdge e2, CellCorner ref, vector<Segment> &segments) const
		{
			Segment s;
			s.startEdge = edgePoint(e1, s.start);
			s.endEdge   = edgePoint(e2, s.end);

			double refValue;
			const Vec2d refPos = cornerPoint(ref, refValue);
			const Vec2d d = s.end - s.start;
			const Vec2d l = refPos - s.start;
			const double cross = d[0] * l[1] - d[1] * l[0];
			const bool refLow = !(refValue > level_);
			if ((refLow && (cross < 0)) || (!refLow && (cross > 0)))
			{
				swap(s.startEdge, s.endEdge);
				swap(s.start, s.end);
			}
			segments.push_back(s);
		}

	private:
		static double frac(double from, double to, double level)
		{
			if (from == to)
				return 0.5;
			return (level - from) / (to - from);
		}

		// Crossing points are identified by the pixel edge they sit
		// on so neighboring cells agree on them exactly.
		// Horizontal edges (r, c)-(r, c+1) get even ids,
		// vertical edges (r, c)-(r+1, c) get odd ones
		long hEdge(int r, int c) const { return 2L * ((long)r * cols_ + c); }
		long vEdge(int r, int c) const { return 2L * ((long)r * cols_ + c) + 1; }

		long edgePoint(CellEdge e, Vec2d &pt) const
		{
			switch (e)
			{
				case TOP:
					pt = Vec2d(r_, c_ + frac(ul_, ur_, level_));
					return hEdge(r_, c_);
				case BOTTOM:
					pt = Vec2d(r_ + 1, c_ + frac(ll_, lr_, level_));
					return hEdge(r_ + 1, c_);
				case LEFT:
					pt = Vec2d(r_ + frac(ul_, ll_, level_), c_);
					return vEdge(r_, c_);
				default:
					pt = Vec2d(r_ + frac(ur_, lr_, level_), c_ + 1);
					return vEdge(r_, c_ + 1);
			}
		}

		Vec2d cornerPoint(CellCorner corner, double &value) const
		{
			switch (corner)
			{
				case UL:
					value = ul_;
					return Vec2d(r_, c_);
				case UR:
					value = ur_;
					return Vec2d(r_, c_ + 1);
				case LL:
					value = ll_;
					return Vec2d(r_ + 1, c_);
				default:
					value = lr_;
					return Vec2d(r_ + 1, c_ + 1);
			}
		}

		int    r_;
		int    c_;
		int    cols_;
		double level_;
		double ul_;
		double ur_;
		double ll_;
		double lr_;
};

void cellSegments(const Cell &cell, vector<Segment> &segments)
{
	switch (cell.squareCase())
	{
		case 0:
		case 15:
			break;
		case 1:
		case 14:
			cell.addSegment(TOP, LEFT, UL, segments);
			break;
		case 2:
		case 13:
			cell.addSegment(TOP, RIGHT, UR, segments);
			break;
		case 3:
		case 12:
			cell.addSegment(LEFT, RIGHT, UL, segments);
			break;
		case 4:
		case 11:
			cell.addSegment(LEFT, BOTTOM, LL, segments);
			break;
		case 5:
		case 10:
			cell.addSegment(TOP, BOTTOM, UL, segments);
			break;
		case 7:
		case 8:
			cell.addSegment(RIGHT, BOTTOM, LR, segments);
			break;
		// Saddles - cut off the two high corners so the
		// low ones stay connected through the middle
		case 6:
			cell.addSegment(TOP, RIGHT, UR, segments);
			cell.addSegment(LEFT, BOTTOM, LL, segments);
			break;
		case 9:
			cell.addSegment(TOP, LEFT, UL, segments);
			cell.addSegment(RIGHT, BOTTOM, LR, segments);
			break;
	}
}
}

vector<IsoContour> findIsoContours(const Mat &image, double level)
{
	vector<IsoContour> contours;
	if (image.empty() || (image.channels() != 1) || (image.rows < 2) || (image.cols < 2))
		return contours;

	Mat values;
	image.convertTo(values, CV_64F);

	vector<Segment> segments;
	for (int r = 0; r < values.rows - 1; r++)
	{
		for (int c = 0; c < values.cols - 1; c++)
		{
			Cell cell(values, r, c, level);
			if (cell.valid())
				cellSegments(cell, segments);
		}
	}

	// Each crossing point starts at most one segment and ends at
	// most one other, so chaining end -> start walks the contour
	const size_t edgeCount = 2 * (size_t)values.rows * values.cols;
	vector<int>  startsAt(edgeCount, -1);
	vector<char> endsAt(edgeCount, 0);
	for (size_t i = 0; i < segments.size(); i++)
	{
		startsAt[segments[i].startEdge] = (int)i;
		endsAt[segments[i].endEdge]     = 1;
	}

	vector<char> used(segments.size(), 0);
	auto follow = [&](int first)
	{
		IsoContour contour;
		contour.push_back(segments[first].start);
		for (int cur = first; (cur >= 0) && !used[cur]; cur = startsAt[segments[cur].endEdge])
		{
			used[cur] = 1;
			contour.push_back(segments[cur].end);
		}
		contours.push_back(contour);
	};

	// Open contours (those which run off the image) first, from
	// the end that has no predecessor. Everything left is closed.
	for (size_t i = 0; i < segments.size(); i++)
		if (!used[i] && !endsAt[segments[i].startEdge])
			follow((int)i);
	for (size_t i = 0; i < segments.size(); i++)
		if (!used[i])
			follow((int)i);

	return contours;
}
