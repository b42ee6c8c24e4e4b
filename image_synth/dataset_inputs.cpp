#include <algorithm>
#include <iostream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>

#include "dataset_inputs.hpp"
#include "synth_errors.hpp"

using namespace std;
namespace fs = ::boost::filesystem;

// Sorted list of the entries of dir, so that runs with
// the same seed pick the same files
static vector<fs::path> sortedEntries(const fs::path &dir)
{
	vector<fs::path> entries;
	for (fs::directory_iterator it(dir), endit; it != endit; ++it)
		entries.push_back(it->path());
	sort(entries.begin(), entries.end());
	return entries;
}

static bool hasExtension(const fs::path &p, const vector<string> &exts)
{
	const string ext = boost::algorithm::to_lower_copy(p.extension().string());
	return find(exts.begin(), exts.end(), ext) != exts.end();
}

vector<string> getFilePaths(const string &folderPath, const vector<string> &exts)
{
	vector<string> filePaths;
	const fs::path root(folderPath);
	if (!fs::is_directory(root))
		return filePaths;

	const vector<fs::path> entries = sortedEntries(root);
	for (auto it = entries.cbegin(); it != entries.cend(); ++it)
	{
		if (fs::is_regular_file(*it) && hasExtension(*it, exts))
			filePaths.push_back(it->string());
		else
			cerr << "Warning: ignoring " << it->string() << endl;
	}
	return filePaths;
}

ForegroundLibrary findForegrounds(const string &inputDir)
{
	const fs::path foregroundDir = fs::path(inputDir) / "foregrounds";
	if (!fs::is_directory(foregroundDir))
		throw ConfigError("foregrounds directory was not found: " + foregroundDir.string());

	const vector<string> exts(1, ".png");
	ForegroundLibrary library;
	size_t count = 0;

	const vector<fs::path> superDirs = sortedEntries(foregroundDir);
	for (auto super = superDirs.cbegin(); super != superDirs.cend(); ++super)
	{
		if (!fs::is_directory(*super))
		{
			cerr << "Warning: ignoring " << super->string() << endl;
			continue;
		}
		const vector<fs::path> categoryDirs = sortedEntries(*super);
		for (auto category = categoryDirs.cbegin(); category != categoryDirs.cend(); ++category)
		{
			if (!fs::is_directory(*category))
			{
				cerr << "Warning: ignoring " << category->string() << endl;
				continue;
			}
			vector<string> files = getFilePaths(category->string(), exts);
			if (files.empty())
				continue;
			count += files.size();
			library[super->filename().string()][category->filename().string()] = files;
		}
	}

	if (count == 0)
		throw ConfigError("no foreground images found under " + foregroundDir.string());
	return library;
}

vector<string> findBackgrounds(const string &inputDir)
{
	const fs::path backgroundDir = fs::path(inputDir) / "backgrounds";
	if (!fs::is_directory(backgroundDir))
		throw ConfigError("backgrounds directory was not found: " + backgroundDir.string());

	vector<string> exts;
	exts.push_back(".png");
	exts.push_back(".jpg");
	exts.push_back(".jpeg");
	vector<string> backgrounds = getFilePaths(backgroundDir.string(), exts);
	if (backgrounds.empty())
		throw ConfigError("no background images found in " + backgroundDir.string());
	return backgrounds;
}
