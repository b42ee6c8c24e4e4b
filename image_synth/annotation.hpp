#pragma once

#include <map>
#include <vector>

#include <opencv2/opencv.hpp>

#include "contour_polygon.hpp"
#include "instance_color.hpp"

// COCO object annotation for one instance in one image
struct Annotation
{
	std::vector<std::vector<double> > segmentation;
	double     area;
	int        iscrowd;
	long       imageId;
	cv::Rect2d bbox;
	int        categoryId;
	long       id;
};

// Category id for each instance color of one particular mask
typedef std::map<InstanceColor, int> CategoryIdMap;

// Creates annotations from color-coded instance masks. Annotation
// ids come from a single counter which keeps running across every
// mask passed in, so ids are unique within one assembler's lifetime.
class AnnotationAssembler
{
	public:
		explicit AnnotationAssembler(const PolygonizerParams &params = PolygonizerParams(),
									 long firstId = 0);

		// One annotation per instance color found in mask which has
		// a category and at least one polygon surviving the noise
		// filter. Colors without a category are reported on stderr
		// and skipped.
		std::vector<Annotation> createAnnotations(const cv::Mat &mask, long imageId,
												  const CategoryIdMap &categoryIds);

		// Id the next annotation created will get
		long nextId(void) const { return nextId_; }

	private:
		ContourPolygonizer polygonizer_;
		long               nextId_;
};
