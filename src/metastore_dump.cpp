#include "extraction/extraction_config.hpp"
#include "extraction/extraction_runner.hpp"
#include "metastore_logging.hpp"

#include <iostream>

using namespace dumper;

int main(int argc, char **argv) {
	if (argc != 2) {
		std::cerr << "usage: " << argv[0] << " <config.yaml>" << std::endl;
		return 2;
	}

	ExtractionConfig config;
	try {
		config = LoadExtractionConfig(argv[1]);
	} catch (const MetastoreException &e) {
		std::cerr << MetastoreErrorCodeToString(e.GetErrorCode()) << ": " << e.what() << std::endl;
		return 2;
	}

	InitializeLogging(config.logging);
	ExtractionRunner runner(std::move(config));
	auto report = runner.Run();
	std::cout << report.Summary();
	ShutdownLogging();
	return report.HasFailures() ? 1 : 0;
}
