#include "image_io.hpp"
#include "random_background.hpp"
#include "synth_errors.hpp"

using namespace std;
using namespace cv;

RandomBackground::RandomBackground(const vector<string> &fileNames) :
	fileNames_(fileNames)
{
	if (fileNames_.empty())
		throw ConfigError("no background images to choose from");
	images_.resize(fileNames_.size());
}

Mat RandomBackground::get(RNG &rng, string &fileName)
{
	// Grab a random image from the list
	const int idx = rng.uniform(0, static_cast<int>(fileNames_.size()));

	// Load it if necessary, otherwise just
	// re-use previously loaded copy
	if (images_[idx] == NULL)
		images_[idx] = make_shared<Mat>(loadImage(fileNames_[idx]));

	fileName = fileNames_[idx];
	return *images_[idx];
}
