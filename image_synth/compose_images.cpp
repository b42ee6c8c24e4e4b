#include <ctime>
#include <iostream>
#include <string>

#include <boost/filesystem.hpp>

#include "Args.hpp"
#include "coco_json.hpp"
#include "image_composition.hpp"

using namespace std;
namespace fs = ::boost::filesystem;

static bool askYesNo(const string &question)
{
	cout << question << " (y/n) ";
	string answer;
	if (!getline(cin, answer))
		return false;
	return (answer == "y") || (answer == "Y") || (answer == "yes") || (answer == "Yes");
}

static string ask(const string &prompt)
{
	cout << prompt;
	string answer;
	getline(cin, answer);
	return answer;
}

// Interactive helper to fill in dataset_info.json. The file can
// always be edited by hand afterwards
static void createDatasetInfo(const string &outputDir)
{
	if (!askYesNo("Would you like to create dataset info json?"))
	{
		cout << "No problem. You can always create the json manually." << endl;
		return;
	}

	cout << "Note: you can always modify the json manually if you need to update this." << endl;
	DatasetInfo info;
	info.description = ask("Description: ");
	info.url         = ask("URL: ");
	info.version     = ask("Version: ");
	info.contributor = ask("Contributor: ");

	const time_t now = time(NULL);
	const struct tm *local = localtime(&now);
	char date[16];
	strftime(date, sizeof(date), "%m/%d/%Y", local);
	info.year        = local->tm_year + 1900;
	info.dateCreated = date;

	if (askYesNo("Add an image license?"))
	{
		info.licenseName = ask("License name: ");
		info.licenseUrl  = ask("License URL: ");
	}

	const string fileName = (fs::path(outputDir) / "dataset_info.json").string();
	info.write(fileName);
	cout << "Successfully created " << fileName << endl;
}

static bool isEmptyDir(const string &dirName)
{
	return !fs::is_directory(dirName) || fs::is_empty(dirName);
}

int main(int argc, const char **argv)
{
	ComposeArgs args;
	if (!args.processArgs(argc, argv))
		return 1;

	CompositionConfig config;
	config.inputDir       = args.inputDir;
	config.outputDir      = args.outputDir;
	config.count          = args.count;
	config.width          = args.width;
	config.height         = args.height;
	config.outputType     = args.outputType;
	config.maxForegrounds = args.maxForegrounds;
	config.seeded         = args.seeded;
	config.seed           = args.seed;

	try
	{
		ImageComposition composition(config);

		if (!args.silent && !isEmptyDir(composition.imagesDir()))
		{
			if (!askYesNo("output_dir is not empty, files may be overwritten.\nContinue?"))
				return 0;
		}

		composition.run();

		if (!args.silent)
			createDatasetInfo(args.outputDir);
	}
	catch (const exception &e)
	{
		cerr << "Error: " << e.what() << endl;
		return 1;
	}
	return 0;
}
