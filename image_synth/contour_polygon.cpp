#include <cmath>

#include "contour_polygon.hpp"
#include "iso_contours.hpp"

using namespace std;
using namespace cv;
namespace bg = boost::geometry;

ContourPolygonizer::ContourPolygonizer(const PolygonizerParams &params) :
	params_(params)
{
}

bool ContourPolygonizer::polygonize(const Mat &bitmap, InstancePolygons &out) const
{
	GeoMultiPolygon polygons = extractPolygons(bitmap);
	if (polygons.empty())
		return false;

	InstancePolygons result;
	result.area = 0.0;
	for (auto it = polygons.cbegin(); it != polygons.cend(); ++it)
	{
		vector<double> flat;
		flat.reserve(it->outer().size() * 2);
		for (auto pt = it->outer().cbegin(); pt != it->outer().cend(); ++pt)
		{
			flat.push_back(pt->x());
			flat.push_back(pt->y());
		}
		result.segmentation.push_back(flat);
		result.area += polygonArea(*it);
	}

	// Box and area cover every polygon of the instance, not
	// just the biggest one
	GeoBox bounds;
	bg::envelope(polygons, bounds);
	result.bbox = Rect2d(bounds.min_corner().x(), bounds.min_corner().y(),
						 bounds.max_corner().x() - bounds.min_corner().x(),
						 bounds.max_corner().y() - bounds.min_corner().y());

	out = result;
	return true;
}

GeoMultiPolygon ContourPolygonizer::extractPolygons(const Mat &bitmap) const
{
	GeoMultiPolygon polygons;
	vector<IsoContour> contours = findIsoContours(bitmap, params_.level);
	for (auto it = contours.cbegin(); it != contours.cend(); ++it)
	{
		GeoPolygon polygon;
		if (contourToPolygon(*it, polygon))
			polygons.push_back(polygon);
	}
	return polygons;
}

bool ContourPolygonizer::contourToPolygon(const vector<Vec2d> &contour, GeoPolygon &polygon) const
{
	// Flip (row, col) to (x, y) and undo the padding
	GeoLinestring line;
	for (auto it = contour.cbegin(); it != contour.cend(); ++it)
		line.push_back(GeoPoint((*it)[1] - params_.padding, (*it)[0] - params_.padding));
	if (line.size() < 3)
		return false;
	if (!bg::equals(line.front(), line.back()))
		line.push_back(line.front());

	GeoLinestring simple = simplifyLine(line, params_.tolerance);

	GeoPolygon candidate;
	bg::append(candidate.outer(), simple);

	// Less than 3 distinct points is a line or a point
	if (candidate.outer().size() < 4)
		return false;

	// Simplification can fold the ring over itself, splitting
	// the region into pieces. Noise is judged on the pieces
	const bool multiPart = selfIntersects(candidate);
	double area = 0.0;
	if (multiPart)
	{
		vector<GeoPolygon> parts = splitRing(candidate);
		for (auto it = parts.cbegin(); it != parts.cend(); ++it)
			area += polygonArea(*it);
	}
	else
		area = polygonArea(candidate);
	if (area <= params_.minArea)
		return false;

	// Use the hull of the pieces
	if (multiPart)
	{
		GeoPolygon hull;
		bg::convex_hull(candidate, hull);
		candidate = hull;
		if ((candidate.outer().size() < 4) || (polygonArea(candidate) <= 0.0))
			return false;
	}

	polygon = candidate;
	return true;
}

GeoLinestring simplifyLine(const GeoLinestring &line, double tolerance)
{
	GeoLinestring simple;
	bg::simplify(line, simple, tolerance);
	return simple;
}

bool selfIntersects(const GeoPolygon &polygon)
{
	GeoPolygon corrected(polygon);
	bg::correct(corrected);
	return bg::intersects(corrected);
}

// Point where segments a and b meet, if they do
static bool segmentCrossing(const GeoSegment &a, const GeoSegment &b, GeoPoint &p)
{
	if (!bg::intersects(a, b))
		return false;

	const double rx = a.second.x() - a.first.x();
	const double ry = a.second.y() - a.first.y();
	const double sx = b.second.x() - b.first.x();
	const double sy = b.second.y() - b.first.y();
	const double denom = rx * sy - ry * sx;
	if (fabs(denom) < 1e-12)
	{
		// Collinear overlap - cut at an end of b lying on a
		p = (bg::distance(b.first, a) < 1e-9) ? b.first : b.second;
		return true;
	}

	const double t = ((b.first.x() - a.first.x()) * sy - (b.first.y() - a.first.y()) * sx) / denom;
	p = GeoPoint(a.first.x() + t * rx, a.first.y() + t * ry);
	return true;
}

// closed repeats its first point at the end. Every cut leaves both
// loops with fewer segments than the ring they came from
static void splitLoop(const vector<GeoPoint> &closed, vector<GeoPolygon> &parts)
{
	vector<GeoPoint> ring;
	for (auto it = closed.cbegin(); it != closed.cend(); ++it)
		if (ring.empty() || !bg::equals(ring.back(), *it))
			ring.push_back(*it);
	if (ring.size() < 4)
		return;

	const size_t n = ring.size();
	for (size_t i = 0; i + 2 < n; i++)
	{
		const GeoSegment si(ring[i], ring[i + 1]);
		for (size_t j = i + 2; j + 1 < n; j++)
		{
			// First and last segments meet at the closing point
			if ((i == 0) && (j == n - 2))
				continue;

			GeoPoint p;
			if (!segmentCrossing(si, GeoSegment(ring[j], ring[j + 1]), p))
				continue;

			vector<GeoPoint> first(1, p);
			for (size_t k = i + 1; k <= j; k++)
				first.push_back(ring[k]);
			first.push_back(p);

			vector<GeoPoint> second(1, p);
			for (size_t k = j + 1; k + 1 < n; k++)
				second.push_back(ring[k]);
			for (size_t k = 0; k <= i; k++)
				second.push_back(ring[k]);
			second.push_back(p);

			splitLoop(first, parts);
			splitLoop(second, parts);
			return;
		}
	}

	GeoPolygon part;
	bg::append(part.outer(), ring);
	parts.push_back(part);
}

vector<GeoPolygon> splitRing(const GeoPolygon &polygon)
{
	vector<GeoPolygon> parts;
	vector<GeoPoint> ring(polygon.outer().begin(), polygon.outer().end());
	if (!ring.empty() && !bg::equals(ring.front(), ring.back()))
		ring.push_back(ring.front());
	splitLoop(ring, parts);
	return parts;
}

double polygonArea(const GeoPolygon &polygon)
{
	// Traced rings can run either way around
	return fabs(bg::area(polygon));
}
