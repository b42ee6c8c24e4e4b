#include <iostream>

#include "annotation.hpp"
#include "mask_decompose.hpp"

using namespace std;
using namespace cv;

AnnotationAssembler::AnnotationAssembler(const PolygonizerParams &params, long firstId) :
	polygonizer_(params),
	nextId_(firstId)
{
}

vector<Annotation> AnnotationAssembler::createAnnotations(const Mat &mask, long imageId,
														  const CategoryIdMap &categoryIds)
{
	vector<Annotation> annotations;
	IsolatedMasks isolated = decomposeMask(mask);
	for (auto it = isolated.cbegin(); it != isolated.cend(); ++it)
	{
		auto category = categoryIds.find(it->first);
		if (category == categoryIds.end())
		{
			cerr << "Warning: category color not found: " << it->first
				 << "; check for missing category or antialiasing" << endl;
			continue;
		}

		// Nothing visible - most likely covered up
		// by foregrounds pasted after it
		InstancePolygons polygons;
		if (!polygonizer_.polygonize(it->second, polygons))
			continue;

		Annotation annotation;
		annotation.segmentation = polygons.segmentation;
		annotation.area         = polygons.area;
		annotation.iscrowd      = 0;
		annotation.imageId      = imageId;
		annotation.bbox         = polygons.bbox;
		annotation.categoryId   = category->second;
		annotation.id           = nextId_++;
		annotations.push_back(annotation);
	}
	return annotations;
}
