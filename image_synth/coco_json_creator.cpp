#include <iostream>
#include <string>

#include <boost/filesystem.hpp>

#include "Args.hpp"
#include "coco_json.hpp"

using namespace std;

int main(int argc, const char **argv)
{
	CocoArgs args;
	if (!args.processArgs(argc, argv))
		return 1;

	try
	{
		MaskDefinitions maskDefinitions = MaskDefinitions::read(args.maskDefinitionFile);
		DatasetInfo     datasetInfo     = DatasetInfo::read(args.datasetInfoFile);

		// Paths in the definitions are relative to the file's own directory
		const string datasetDir = boost::filesystem::path(args.maskDefinitionFile).parent_path().string();
		CocoJsonCreator creator(maskDefinitions, datasetInfo, datasetDir.empty() ? "." : datasetDir);
		creator.write();
	}
	catch (const exception &e)
	{
		cerr << "Error: " << e.what() << endl;
		return 1;
	}
	return 0;
}
