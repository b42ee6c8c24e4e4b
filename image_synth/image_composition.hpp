#pragma once

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "compositor.hpp"
#include "dataset_inputs.hpp"
#include "foreground_transform.hpp"
#include "instance_color.hpp"
#include "mask_definitions.hpp"
#include "random_background.hpp"

struct CompositionConfig
{
	std::string inputDir;   // holds foregrounds/ and backgrounds/
	std::string outputDir;  // images/, masks/ and mask_definitions.json go here
	int         count          = 0;
	int         width          = 0;
	int         height         = 0;
	std::string outputType     = ".jpg";
	int         maxForegrounds = 3;
	int         alphaThreshold = 200;
	std::vector<InstanceColor> palette = defaultPalette();
	TransformParams transform;
	bool        seeded         = false; // false : seed from the clock
	uint64      seed           = 0;

	// Throws ConfigError naming the first bad parameter
	void validate(void) const;

	// outputType lower-cased with a leading dot
	std::string extension(void) const;
};

// A complete generation run : for each output image pick a background
// and 1..maxForegrounds foregrounds, transform and paste them, and save
// the composite and its instance mask. Each mask's legend is recorded
// in the mask definitions written at the end.
class ImageComposition
{
	public:
		// Validates config and crawls the input dir. Throws ConfigError
		// before anything is written.
		explicit ImageComposition(const CompositionConfig &config);

		// Generate every image. Errors in any one image end the run.
		MaskDefinitions run(void);

		std::string imagesDir(void) const;
		std::string masksDir(void) const;
		std::string maskDefinitionsPath(void) const;

	private:
		// Generate image number index, adding its legend to maskDefinitions
		void composeOne(int index, MaskDefinitions &maskDefinitions);

		CompositionConfig     config_;
		ForegroundLibrary     foregrounds_;
		RandomBackground      backgrounds_;
		ForegroundTransformer transformer_;
		Compositor            compositor_;
		cv::RNG               rng_;
};
