#include <cstdio>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>

#include "image_composition.hpp"
#include "image_io.hpp"
#include "synth_errors.hpp"

using namespace std;
using namespace cv;
namespace fs = ::boost::filesystem;

static const int minOutputSize = 64;

string CompositionConfig::extension(void) const
{
	string ext = boost::algorithm::to_lower_copy(outputType);
	if (!ext.empty() && (ext[0] != '.'))
		ext = "." + ext;
	return ext;
}

void CompositionConfig::validate(void) const
{
	stringstream ss;
	if (count <= 0)
		ss << "count must be greater than 0, got " << count;
	else if (width < minOutputSize)
		ss << "width must be at least " << minOutputSize << ", got " << width;
	else if (height < minOutputSize)
		ss << "height must be at least " << minOutputSize << ", got " << height;
	else if ((extension() != ".png") && (extension() != ".jpg") && (extension() != ".jpeg"))
		ss << "output_type must be png, jpg or jpeg, got \"" << outputType << "\"";
	else if (maxForegrounds < 1)
		ss << "max_foregrounds must be at least 1, got " << maxForegrounds;
	else if ((alphaThreshold < 0) || (alphaThreshold > 255))
		ss << "alpha threshold must be in 0..255, got " << alphaThreshold;
	else if (palette.size() < static_cast<size_t>(maxForegrounds))
		ss << "palette has " << palette.size() << " colors, max_foregrounds is " << maxForegrounds;
	else
	{
		set<InstanceColor> seen;
		for (auto it = palette.cbegin(); it != palette.cend(); ++it)
		{
			if (it->isBackground())
			{
				ss << "palette color " << *it << " is reserved for background";
				break;
			}
			if (!seen.insert(*it).second)
			{
				ss << "palette color " << *it << " is used more than once";
				break;
			}
		}
	}

	if (!ss.str().empty())
		throw ConfigError(ss.str());
}

// config has to be checked before anything else is built from it
static const CompositionConfig &validated(const CompositionConfig &config)
{
	config.validate();
	return config;
}

ImageComposition::ImageComposition(const CompositionConfig &config) :
	config_(validated(config)),
	foregrounds_(findForegrounds(config_.inputDir)),
	backgrounds_(findBackgrounds(config_.inputDir)),
	transformer_(config_.transform),
	compositor_(Size(config_.width, config_.height), config_.alphaThreshold),
	rng_(config_.seeded ? config_.seed : static_cast<uint64>(getTickCount()))
{
}

string ImageComposition::imagesDir(void) const
{
	return (fs::path(config_.outputDir) / "images").string();
}

string ImageComposition::masksDir(void) const
{
	return (fs::path(config_.outputDir) / "masks").string();
}

string ImageComposition::maskDefinitionsPath(void) const
{
	return (fs::path(config_.outputDir) / "mask_definitions.json").string();
}

// Pick a random entry of a non-empty map
template <class M>
static typename M::const_iterator randomEntry(const M &m, RNG &rng)
{
	auto it = m.cbegin();
	advance(it, rng.uniform(0, static_cast<int>(m.size())));
	return it;
}

void ImageComposition::composeOne(int index, MaskDefinitions &maskDefinitions)
{
	string backgroundName;
	Mat background = backgrounds_.get(rng_, backgroundName);

	// uniform() excludes the upper bound
	const int numForegrounds = rng_.uniform(1, config_.maxForegrounds + 1);

	vector<ForegroundLayer> layers;
	CategoryColorMap legend;
	for (int k = 0; k < numForegrounds; k++)
	{
		auto super    = randomEntry(foregrounds_, rng_);
		auto category = randomEntry(super->second, rng_);
		const vector<string> &files = category->second;
		const string &fileName = files[rng_.uniform(0, static_cast<int>(files.size()))];

		ForegroundLayer layer;
		layer.image = transformer_.transform(loadImage(fileName), rng_, fileName);
		layer.color = config_.palette[k];
		layer.name  = fileName;
		layers.push_back(layer);

		CategoryLabel label;
		label.category      = category->first;
		label.superCategory = super->first;
		legend[layer.color] = label;
	}

	CompositeResult result = compositor_.compose(background, layers, rng_, backgroundName);

	char name[32];
	snprintf(name, sizeof(name), "%08d", index);
	const string imageRelPath = "images/" + string(name) + config_.extension();
	const string maskRelPath  = "masks/" + string(name) + ".png";

	saveImage((fs::path(config_.outputDir) / imageRelPath).string(), result.composite);
	saveImage((fs::path(config_.outputDir) / maskRelPath).string(), result.mask);

	maskDefinitions.addMask(imageRelPath, maskRelPath, legend);
}

MaskDefinitions ImageComposition::run(void)
{
	fs::create_directories(imagesDir());
	fs::create_directories(masksDir());

	cout << "Generating " << config_.count << " images with " << backgrounds_.size()
		 << " backgrounds" << endl;

	MaskDefinitions maskDefinitions;
	for (int i = 0; i < config_.count; i++)
	{
		composeOne(i, maskDefinitions);
		if (((i + 1) % 100) == 0)
			cout << "Generated " << (i + 1) << " of " << config_.count << " images" << endl;
	}

	maskDefinitions.write(maskDefinitionsPath());
	cout << "Image composition completed: " << config_.count << " images in "
		 << config_.outputDir << endl;
	return maskDefinitions;
}
