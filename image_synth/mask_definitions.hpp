#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "instance_color.hpp"

struct CategoryLabel
{
	std::string category;      // e.g. "eagle"
	std::string superCategory; // e.g. "bird"

	bool operator==(const CategoryLabel &other) const
	{
		return (category == other.category) && (superCategory == other.superCategory);
	}
};

// Legend of a single mask image. The same color can mean
// different things in different masks.
typedef std::map<InstanceColor, CategoryLabel> CategoryColorMap;

struct MaskDefinition
{
	std::string      mask; // mask path, relative to the dataset dir
	CategoryColorMap colorCategories;
};

// Entries in the order they were added, keyed by image path
typedef std::vector<std::pair<std::string, MaskDefinition> > MaskDefinitionList;

// Super categories and their categories in the order first seen
typedef std::vector<std::pair<std::string, std::vector<std::string> > > SuperCategoryList;

// Everything needed to turn a directory of composites and masks into
// COCO annotations : which mask belongs to which image, what each mask
// color means, and every category seen grouped by super category.
// Stored as mask_definitions.json. Both lists keep the order entries
// were added (or listed in the file) since image and category ids
// are handed out in that order.
class MaskDefinitions
{
	public:
		// Returns false if category was already known
		bool addCategory(const std::string &category, const std::string &superCategory);

		// Returns false if imagePath was already added. Categories
		// in the legend are added as well
		bool addMask(const std::string &imagePath, const std::string &maskPath,
					 const CategoryColorMap &colorCategories);

		// Image paths are relative to the dataset dir
		const MaskDefinitionList &masks(void) const { return masks_; }
		const SuperCategoryList &superCategories(void) const { return superCategories_; }

		// NULL if imagePath isn't known
		const MaskDefinition *findMask(const std::string &imagePath) const;

		nlohmann::ordered_json toJson(void) const;

		// source names the document in error messages
		static MaskDefinitions fromJson(const nlohmann::ordered_json &j, const std::string &source);

		void write(const std::string &fileName) const;
		static MaskDefinitions read(const std::string &fileName);

	private:
		MaskDefinitionList               masks_;
		std::map<std::string, size_t>    maskIndex_;
		SuperCategoryList                superCategories_;
};
