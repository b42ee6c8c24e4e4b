#pragma once

#include <string>

#include <opencv2/opencv.hpp>

// Arguments to compose_images
class ComposeArgs
{
	public :
		std::string inputDir;       // foregrounds/ and backgrounds/ live here
		std::string outputDir;      // where the dataset is written
		int         count;          // number of images to generate
		int         width;          // output image size
		int         height;
		std::string outputType;     // png, jpg or jpeg
		int         maxForegrounds; // at most this many foregrounds per image
		bool        seeded;         // --seed given?
		uint64      seed;
		bool        silent;         // no prompts, skip the dataset info wizard

		ComposeArgs(void);
		bool processArgs(int argc, const char **argv);
};

// Arguments to coco_json_creator
class CocoArgs
{
	public :
		std::string maskDefinitionFile; // mask_definitions.json from compose_images
		std::string datasetInfoFile;    // dataset_info.json

		CocoArgs(void);
		bool processArgs(int argc, const char **argv);
};
