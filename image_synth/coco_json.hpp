#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "annotation.hpp"
#include "mask_definitions.hpp"

// Contents of dataset_info.json - the "info" and "licenses"
// sections of the COCO file
struct DatasetInfo
{
	std::string description;
	std::string url;
	std::string version;
	int         year = 0;
	std::string contributor;
	std::string dateCreated;

	int         licenseId = 0;
	std::string licenseName = "None";
	std::string licenseUrl;

	nlohmann::json toJson(void) const;
	static DatasetInfo fromJson(const nlohmann::json &j, const std::string &source);

	void write(const std::string &fileName) const;
	static DatasetInfo read(const std::string &fileName);
};

// (super category, category)
typedef std::pair<std::string, std::string> CategoryKey;
typedef std::map<CategoryKey, int> CategoryIdsByName;

nlohmann::json annotationToJson(const Annotation &annotation);

// Builds coco_instances.json for a generated dataset. Image and
// mask paths in the definitions are relative to datasetDir.
class CocoJsonCreator
{
	public:
		CocoJsonCreator(const MaskDefinitions &maskDefinitions,
						const DatasetInfo &datasetInfo,
						const std::string &datasetDir,
						const PolygonizerParams &params = PolygonizerParams());

		// Category ids start at 1, 0 being the background. They are
		// handed out in the order the definitions list super categories
		// and their categories
		nlohmann::json createCategories(CategoryIdsByName &categoryIds) const;

		// Image ids start at 0 in mask definition order. Each mask is
		// read and turned into annotations
		void createImagesAndAnnotations(const CategoryIdsByName &categoryIds,
										nlohmann::json &images,
										nlohmann::json &annotations) const;

		// The complete document
		nlohmann::json create(void) const;

		// Write <datasetDir>/coco_instances.json, returning its path
		std::string write(void) const;

	private:
		MaskDefinitions        maskDefinitions_;
		DatasetInfo            datasetInfo_;
		std::string            datasetDir_;
		PolygonizerParams      params_;
};
