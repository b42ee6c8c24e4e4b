#pragma once

#include <map>
#include <string>
#include <vector>

// super category -> category -> cutout file paths
typedef std::map<std::string, std::map<std::string, std::vector<std::string> > > ForegroundLibrary;

// Return the file paths in folderPath (not its subdirectories) with
// one of the given extensions, sorted by name. Files with other
// extensions are reported and skipped.
std::vector<std::string> getFilePaths(const std::string &folderPath,
									  const std::vector<std::string> &exts);

// Crawl <inputDir>/foregrounds/<super category>/<category>/*.png.
// Throws ConfigError if the directory is missing or has no cutouts
ForegroundLibrary findForegrounds(const std::string &inputDir);

// All .png, .jpg and .jpeg files in <inputDir>/backgrounds.
// Throws ConfigError if the directory is missing or has no images
std::vector<std::string> findBackgrounds(const std::string &inputDir);
