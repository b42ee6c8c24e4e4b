#include <algorithm>
#include <fstream>

#include "mask_definitions.hpp"
#include "synth_errors.hpp"

using namespace std;
using json = nlohmann::ordered_json;

bool MaskDefinitions::addCategory(const string &category, const string &superCategory)
{
	auto super = superCategories_.begin();
	while ((super != superCategories_.end()) && (super->first != superCategory))
		++super;
	if (super == superCategories_.end())
		super = superCategories_.insert(super, make_pair(superCategory, vector<string>()));

	vector<string> &categories = super->second;
	if (find(categories.begin(), categories.end(), category) != categories.end())
		return false;
	categories.push_back(category);
	return true;
}

bool MaskDefinitions::addMask(const string &imagePath, const string &maskPath,
							  const CategoryColorMap &colorCategories)
{
	if (maskIndex_.count(imagePath))
		return false;

	MaskDefinition def;
	def.mask            = maskPath;
	def.colorCategories = colorCategories;
	maskIndex_[imagePath] = masks_.size();
	masks_.push_back(make_pair(imagePath, def));

	// Regardless of color, every category needs to be
	// listed under its super category
	for (auto it = colorCategories.cbegin(); it != colorCategories.cend(); ++it)
		addCategory(it->second.category, it->second.superCategory);

	return true;
}

const MaskDefinition *MaskDefinitions::findMask(const string &imagePath) const
{
	auto it = maskIndex_.find(imagePath);
	if (it == maskIndex_.end())
		return NULL;
	return &masks_[it->second].second;
}

json MaskDefinitions::toJson(void) const
{
	json masks = json::object();
	for (auto it = masks_.cbegin(); it != masks_.cend(); ++it)
	{
		json colors = json::object();
		for (auto cc = it->second.colorCategories.cbegin(); cc != it->second.colorCategories.cend(); ++cc)
		{
			colors[cc->first.key()] = {
				{"category",       cc->second.category},
				{"super_category", cc->second.superCategory}
			};
		}
		masks[it->first] = {
			{"mask",             it->second.mask},
			{"color_categories", colors}
		};
	}

	json superCategories = json::object();
	for (auto it = superCategories_.cbegin(); it != superCategories_.cend(); ++it)
		superCategories[it->first] = it->second;

	return {
		{"masks",            masks},
		{"super_categories", superCategories}
	};
}

MaskDefinitions MaskDefinitions::fromJson(const json &j, const string &source)
{
	if (!j.is_object() || !j.contains("masks") || !j["masks"].is_object())
		throw ConfigError("mask definitions missing \"masks\" object: " + source);

	MaskDefinitions defs;
	try
	{
		// Listed categories go first so they keep the file's order.
		// Legends then add any the list is missing
		if (j.contains("super_categories"))
		{
			const json &superCategories = j["super_categories"];
			for (auto it = superCategories.cbegin(); it != superCategories.cend(); ++it)
				for (auto cat = it.value().cbegin(); cat != it.value().cend(); ++cat)
					defs.addCategory(cat->get<string>(), it.key());
		}

		const json &masks = j["masks"];
		for (auto it = masks.cbegin(); it != masks.cend(); ++it)
		{
			CategoryColorMap colorCategories;
			const json &colors = it.value().at("color_categories");
			for (auto cc = colors.cbegin(); cc != colors.cend(); ++cc)
			{
				InstanceColor color;
				if (!InstanceColor::fromKey(cc.key(), color))
					throw ConfigError("invalid color key \"" + cc.key() + "\" for " + it.key() + " in " + source);
				CategoryLabel label;
				label.category      = cc.value().at("category").get<string>();
				label.superCategory = cc.value().at("super_category").get<string>();
				colorCategories[color] = label;
			}
			defs.addMask(it.key(), it.value().at("mask").get<string>(), colorCategories);
		}
	}
	catch (const json::exception &e)
	{
		throw ConfigError("malformed mask definitions in " + source + " : " + e.what());
	}
	return defs;
}

void MaskDefinitions::write(const string &fileName) const
{
	ofstream out(fileName.c_str());
	if (!out)
		throw runtime_error("Could not open " + fileName + " for writing");
	out << toJson().dump();
	if (!out)
		throw runtime_error("Error writing " + fileName);
}

MaskDefinitions MaskDefinitions::read(const string &fileName)
{
	ifstream in(fileName.c_str());
	if (!in)
		throw ConfigError("mask definition file was not found: " + fileName);

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
