#include <fstream>
#include <iostream>

#include <boost/filesystem.hpp>

#include "coco_json.hpp"
#include "image_io.hpp"
#include "synth_errors.hpp"

using namespace std;
using namespace cv;
using json = nlohmann::json;

json DatasetInfo::toJson(void) const
{
	return {
		{"info", {
			{"description",  description},
			{"url",          url},
			{"version",      version},
			{"year",         year},
			{"contributor",  contributor},
			{"date_created", dateCreated}
		}},
		{"license", {
			{"id",   licenseId},
			{"name", licenseName},
			{"url",  licenseUrl}
		}}
	};
}

DatasetInfo DatasetInfo::fromJson(const json &j, const string &source)
{
	if (!j.is_object() || !j.contains("info"))
		throw ConfigError("dataset info missing \"info\" section: " + source);
	if (!j.contains("license"))
		throw ConfigError("dataset info missing \"license\" section: " + source);

	DatasetInfo info;
	try
	{
		const json &i = j["info"];
		info.description = i.value("description", string());
		info.url         = i.value("url", string());
		info.version     = i.value("version", string());
		info.year        = i.value("year", 0);
		info.contributor = i.value("contributor", string());
		info.dateCreated = i.value("date_created", string());

		const json &l = j["license"];
		info.licenseId   = l.value("id", 0);
		info.licenseName = l.value("name", string("None"));
		info.licenseUrl  = l.value("url", string());
	}
	catch (const json::exception &e)
	{
		throw ConfigError("malformed dataset info in " + source + " : " + e.what());
	}
	return info;
}

void DatasetInfo::write(const string &fileName) const
{
	ofstream out(fileName.c_str());
	if (!out)
		throw runtime_error("Could not open " + fileName + " for writing");
	out << toJson().dump(4);
	if (!out)
		throw runtime_error("Error writing " + fileName);
}

DatasetInfo DatasetInfo::read(const string &fileName)
{
	ifstream in(fileName.c_str());
	if (!in)
		throw ConfigError("dataset info file was not found: " + fileName);

	json j;
	try
	{
		in >> j;
	}
	catch (const json::exception &e)
	{
		throw ConfigError("could not parse " + fileName + " : " + e.what());
	}
	return fromJson(j, fileName);
}

json annotationToJson(const Annotation &annotation)
{
	return {
		{"segmentation", annotation.segmentation},
		{"area",         annotation.area},
		{"iscrowd",      annotation.iscrowd},
		{"image_id",     annotation.imageId},
		{"bbox",         {annotation.bbox.x, annotation.bbox.y,
						  annotation.bbox.width, annotation.bbox.height}},
		{"category_id",  annotation.categoryId},
		{"id",           annotation.id}
	};
}

CocoJsonCreator::CocoJsonCreator(const MaskDefinitions &maskDefinitions,
								 const DatasetInfo &datasetInfo,
								 const string &datasetDir,
								 const PolygonizerParams &params) :
	maskDefinitions_(maskDefinitions),
	datasetInfo_(datasetInfo),
	datasetDir_(datasetDir),
	params_(params)
{
}

json CocoJsonCreator::createCategories(CategoryIdsByName &categoryIds) const
{
	json categories = json::array();
	categoryIds.clear();

	int id = 1;
	const auto &superCategories = maskDefinitions_.superCategories();
	for (auto it = superCategories.cbegin(); it != superCategories.cend(); ++it)
	{
		for (auto cat = it->second.cbegin(); cat != it->second.cend(); ++cat)
		{
			categoryIds[CategoryKey(it->first, *cat)] = id;
			categories.push_back({
				{"supercategory", it->first},
				{"id",            id},
				{"name",          *cat}
			});
			id += 1;
		}
	}
	return categories;
}

// Paths in the definitions are relative to the dataset dir
static string datasetPath(const string &datasetDir, const string &relPath)
{
	return (boost::filesystem::path(datasetDir) / relPath).string();
}

static Mat readDatasetImage(const string &fileName)
{
	if (!boost::filesystem::is_regular_file(fileName))
		throw ConfigError("image file was not found: " + fileName);
	try
	{
		return loadImage(fileName);
	}
	catch (const runtime_error &e)
	{
		throw ConfigError(e.what());
	}
}

void CocoJsonCreator::createImagesAndAnnotations(const CategoryIdsByName &categoryIds,
												 json &images,
												 json &annotations) const
{
	images      = json::array();
	annotations = json::array();

	AnnotationAssembler assembler(params_);
	long imageId = 0;
	const auto &masks = maskDefinitions_.masks();
	for (auto it = masks.cbegin(); it != masks.cend(); ++it, ++imageId)
	{
		const string imagePath = datasetPath(datasetDir_, it->first);
		const string maskPath  = datasetPath(datasetDir_, it->second.mask);

		Mat image = readDatasetImage(imagePath);
		images.push_back({
			{"license",   datasetInfo_.licenseId},
			{"file_name", boost::filesystem::path(imagePath).filename().string()},
			{"width",     image.cols},
			{"height",    image.rows},
			{"id",        imageId}
		});

		// Translate this mask's legend into category ids
		CategoryIdMap maskCategoryIds;
		const CategoryColorMap &legend = it->second.colorCategories;
		for (auto cc = legend.cbegin(); cc != legend.cend(); ++cc)
		{
			auto id = categoryIds.find(CategoryKey(cc->second.superCategory, cc->second.category));
			if (id != categoryIds.end())
				maskCategoryIds[cc->first] = id->second;
		}

		Mat mask = readDatasetImage(maskPath);
		vector<Annotation> maskAnnotations = assembler.createAnnotations(mask, imageId, maskCategoryIds);
		for (size_t i = 0; i < maskAnnotations.size(); i++)
			annotations.push_back(annotationToJson(maskAnnotations[i]));
	}
}

json CocoJsonCreator::create(void) const
{
	CategoryIdsByName categoryIds;
	json categories = createCategories(categoryIds);

	json images;
	json annotations;
	createImagesAndAnnotations(categoryIds, images, annotations);

	json info = datasetInfo_.toJson();
	return {
		{"info",        info["info"]},
		{"licenses",    json::array({info["license"]})},
		{"images",      images},
		{"annotations", annotations},
		{"categories",  categories}
	};
}

string CocoJsonCreator::write(void) const
{
	const json coco = create();

	const string fileName = datasetPath(datasetDir_, "coco_instances.json");
	ofstream out(fileName.c_str());
	if (!out)
		throw runtime_error("Could not open " + fileName + " for writing");
	out << coco.dump();
	if (!out)
		throw runtime_error("Error writing " + fileName);

	cout << "Annotations successfully written to file:" << endl << fileName << endl;
	return fileName;
}
