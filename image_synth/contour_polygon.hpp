#pragma once

#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <opencv2/opencv.hpp>

#include "mask_decompose.hpp"

typedef boost::geometry::model::d2::point_xy<double>    GeoPoint;
typedef boost::geometry::model::polygon<GeoPoint>       GeoPolygon;
typedef boost::geometry::model::multi_polygon<GeoPolygon> GeoMultiPolygon;
typedef boost::geometry::model::linestring<GeoPoint>    GeoLinestring;
typedef boost::geometry::model::box<GeoPoint>           GeoBox;
typedef boost::geometry::model::segment<GeoPoint>       GeoSegment;

struct PolygonizerParams
{
	double level     = 0.5;  // iso-value traced in the 0/1 bitmap
	double tolerance = 1.0;  // Douglas-Peucker tolerance, pixels
	double minArea   = 16.0; // polygons this size or smaller are noise
	int    padding   = MASK_PADDING;
};

// Polygons of one instance, ready to become an annotation
struct InstancePolygons
{
	// One flattened [x0, y0, x1, y1, ...] exterior ring per polygon,
	// first point repeated at the end
	std::vector<std::vector<double> > segmentation;
	cv::Rect2d bbox; // bounds of all polygons together
	double     area; // summed area of all polygons
};

// Turns a padded 0/1 instance bitmap into simplified polygons.
//
// Each traced contour becomes its own polygon (so the boundary of a
// hole shows up as a separate polygon). A contour which simplification
// folds over onto itself no longer describes a single region but
// several pieces. The pieces together have to pass the noise filter,
// after which they are replaced by their convex hull. This gives up
// the exact shape of such regions in exchange for always producing
// simple polygons.
class ContourPolygonizer
{
	public:
		explicit ContourPolygonizer(const PolygonizerParams &params = PolygonizerParams());

		// Returns false if nothing survives simplification and
		// filtering (e.g. the instance was completely covered by
		// other instances). out is untouched in that case.
		bool polygonize(const cv::Mat &bitmap, InstancePolygons &out) const;

		// The surviving polygons in unpadded image coordinates
		GeoMultiPolygon extractPolygons(const cv::Mat &bitmap) const;

		// One traced (row, col) contour of a padded bitmap to a polygon
		// in image coordinates. Returns false if it is dropped
		bool contourToPolygon(const std::vector<cv::Vec2d> &contour, GeoPolygon &polygon) const;

	private:
		PolygonizerParams params_;
};

// Douglas-Peucker with the end points held fixed; for a closed ring
// the start/end vertex always survives
GeoLinestring simplifyLine(const GeoLinestring &line, double tolerance);

// True if the closed ring crosses or touches itself
bool selfIntersects(const GeoPolygon &polygon);

// Cut a ring which crosses itself into simple loops at each
// crossing. A simple ring comes back unchanged
std::vector<GeoPolygon> splitRing(const GeoPolygon &polygon);

double polygonArea(const GeoPolygon &polygon);
