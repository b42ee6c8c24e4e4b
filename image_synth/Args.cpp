#include <cerrno>
#include <climits>
#include <iostream>
#include <string>
#include <stdlib.h>
#include "Args.hpp"

using namespace std;

static void ComposeUsage(void)
{
   cout << "Usage : compose_images [option list]" << endl << endl;
   cout << "  Pastes randomly transformed foreground cutouts onto backgrounds, writing" << endl;
   cout << "  the composites, matching instance masks and mask_definitions.json" << endl << endl;

   cout << "\t--input_dir=         dir holding foregrounds/<super category>/<category>/*.png and backgrounds/" << endl;
   cout << "\t--output_dir=        dir to write images/, masks/ and the definitions to" << endl;
   cout << "\t--count=             number of images to generate" << endl;
   cout << "\t--width=             output width, at least 64" << endl;
   cout << "\t--height=            output height, at least 64" << endl;
   cout << "\t--output_type=       png, jpg or jpeg (default jpg)" << endl;
   cout << "\t--max_foregrounds=   max foregrounds per image (default 3)" << endl;
   cout << "\t--seed=              seed the random number generator for a repeatable run" << endl;
   cout << "\t--silent             don't ask before overwriting, skip the dataset info questions" << endl;
   cout << endl;
   cout << "Examples:" << endl;
   cout << "compose_images --input_dir=input --output_dir=output --count=1000 --width=512 --height=512 : generate 1000 512x512 images" << endl;
}

static void CocoUsage(void)
{
   cout << "Usage : coco_json_creator [option list]" << endl << endl;
   cout << "  Writes coco_instances.json next to the mask definition file" << endl << endl;

   cout << "\t--mask_definition=   mask_definitions.json written by compose_images" << endl;
   cout << "\t--dataset_info=      dataset_info.json holding the info and license sections" << endl;
}

// True if arg starts with opt, false otherwise
static bool matches(const string &opt, const char *arg)
{
	return opt.compare(0, opt.length(), arg, opt.length()) == 0;
}

// Parse the integer following opt in arg
static bool intValue(const string &opt, const char *arg, int &value)
{
	const char *start = arg + opt.length();
	char *end;
	errno = 0;
	const long l = strtol(start, &end, 10);
	if ((*start == '\0') || (*end != '\0'))
	{
		cerr << "Invalid value for " << opt << " : " << start << endl;
		return false;
	}
	if ((errno == ERANGE) || (l < INT_MIN) || (l > INT_MAX))
	{
		cerr << "Value out of range for " << opt << " : " << start << endl;
		return false;
	}
	value = static_cast<int>(l);
	return true;
}

ComposeArgs::ComposeArgs(void)
{
	count          = 0;
	width          = 0;
	height         = 0;
	outputType     = "jpg";
	maxForegrounds = 3;
	seeded         = false;
	seed           = 0;
	silent         = false;
}

bool ComposeArgs::processArgs(int argc, const char **argv)
{
	const string inputDirOpt       = "--input_dir=";
	const string outputDirOpt      = "--output_dir=";
	const string countOpt          = "--count=";
	const string widthOpt          = "--width=";
	const string heightOpt         = "--height=";
	const string outputTypeOpt     = "--output_type=";
	const string maxForegroundsOpt = "--max_foregrounds=";
	const string seedOpt           = "--seed=";
	const string silentOpt         = "--silent";
	for (int i = 1; i < argc; i++)
	{
		bool ok = true;
		if (matches(inputDirOpt, argv[i]))
			inputDir = string(argv[i] + inputDirOpt.length());
		else if (matches(outputDirOpt, argv[i]))
			outputDir = string(argv[i] + outputDirOpt.length());
		else if (matches(countOpt, argv[i]))
			ok = intValue(countOpt, argv[i], count);
		else if (matches(widthOpt, argv[i]))
			ok = intValue(widthOpt, argv[i], width);
		else if (matches(heightOpt, argv[i]))
			ok = intValue(heightOpt, argv[i], height);
		else if (matches(outputTypeOpt, argv[i]))
			outputType = string(argv[i] + outputTypeOpt.length());
		else if (matches(maxForegroundsOpt, argv[i]))
			ok = intValue(maxForegroundsOpt, argv[i], maxForegrounds);
		else if (matches(seedOpt, argv[i]))
		{
			const char *start = argv[i] + seedOpt.length();
			char *end;
			errno  = 0;
			seed   = strtoull(start, &end, 10);
			seeded = true;
			if ((*start == '\0') || (*end != '\0') || (*start == '-') || (errno == ERANGE))
			{
				cerr << "Invalid value for " << seedOpt << " : " << start << endl;
				ok = false;
			}
		}
		else if (string(argv[i]) == silentOpt)
			silent = true;
		else
		{
			cerr << "Unknown command line option " << argv[i] << endl;
			ok = false;
		}
		if (!ok)
		{
			ComposeUsage();
			return false;
		}
	}
	if (inputDir.empty() || outputDir.empty())
	{
		cerr << "Both --input_dir and --output_dir are required" << endl;
		ComposeUsage();
		return false;
	}
	return true;
}

CocoArgs::CocoArgs(void)
{
}

bool CocoArgs::processArgs(int argc, const char **argv)
{
	const string maskDefinitionOpt = "--mask_definition=";
	const string datasetInfoOpt    = "--dataset_info=";
	for (int i = 1; i < argc; i++)
	{
		if (matches(maskDefinitionOpt, argv[i]))
			maskDefinitionFile = string(argv[i] + maskDefinitionOpt.length());
		else if (matches(datasetInfoOpt, argv[i]))
			datasetInfoFile = string(argv[i] + datasetInfoOpt.length());
		else
		{
			cerr << "Unknown command line option " << argv[i] << endl;
			CocoUsage();
			return false;
		}
	}
	if (maskDefinitionFile.empty() || datasetInfoFile.empty())
	{
		cerr << "Both --mask_definition and --dataset_info are required" << endl;
		CocoUsage();
		return false;
	}
	return true;
}
