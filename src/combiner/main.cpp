#include "common/util/json_config.h"  // Must be before logging.h for InitLoggingFromJson
#include "common/logging.h"
#include "common/util/strings.h"
#include "combiner/combiner_config.h"
#include "combiner/export_coordinator.h"
#include "combiner/graphics/asset_export_host.h"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

namespace {

// Values given on the command line; they override the config file
struct CommandLine {
	std::string config_file = "avatar_combiner.json";
	std::optional<std::string> import_path;
	std::optional<std::string> export_path;
	std::optional<int64_t> combinations;
	std::optional<uint64_t> seed;
	std::optional<std::vector<std::string>> categories;
	bool dry_run = false;
	bool create_export_dir = false;
};

void PrintUsage(const char* program) {
	std::cout << "Usage: " << program << " --import <folder> --export <folder> [options]\n";
	std::cout << "Options:\n";
	std::cout << "  -i, --import <folder>      Folder with one subfolder per category (body, top, ...)\n";
	std::cout << "  -e, --export <folder>      Folder the .glb sets are written to\n";
	std::cout << "  -n, --combinations <n>     Sets to generate per skeleton (default: 10)\n";
	std::cout << "  -s, --seed <n>             Seed for reproducible selections\n";
	std::cout << "  --categories <a,b,c>       Categories to combine with body (default: all)\n";
	std::cout << "  -c, --config <file>        Config file (default: avatar_combiner.json)\n";
	std::cout << "  --create-export-dir        Create the export folder when missing\n";
	std::cout << "  --dry-run                  Scan, classify and name without exporting\n";
	std::cout << "  --log-level=LEVEL          Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
	std::cout << "  --log-module=MOD:LEVEL     Set per-module log level (e.g., EXPORT:DEBUG)\n";
	std::cout << "                             Modules: SCAN, PARSE, CLASSIFY, COMBINE, NAMING, EXPORT,\n";
	std::cout << "                                      GRAPHICS_LOAD, GLTF, CONFIG, MAIN\n";
	std::cout << "  -h, --help                 Show this help message\n";
}

// Returns 0 to continue, otherwise the process exit code + 1
int ParseCommandLine(int argc, char* argv[], CommandLine& cli) {
	auto needValue = [&](int i, const std::string& arg) {
		if (i + 1 >= argc) {
			std::cerr << "Missing value for " << arg << "\n";
			return false;
		}
		return true;
	};

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--import" || arg == "-i") {
			if (!needValue(i, arg)) return 2;
			cli.import_path = argv[++i];
		} else if (arg == "--export" || arg == "-e") {
			if (!needValue(i, arg)) return 2;
			cli.export_path = argv[++i];
		} else if (arg == "--combinations" || arg == "-n") {
			if (!needValue(i, arg)) return 2;
			std::string value = argv[++i];
			cli.combinations = ACC::Combiner::parseCombinationCount(value);
			if (!cli.combinations) {
				std::cerr << "Invalid combination count: " << value << "\n";
				return 2;
			}
		} else if (arg == "--seed" || arg == "-s") {
			if (!needValue(i, arg)) return 2;
			std::string value = argv[++i];
			cli.seed = ACC::Combiner::parseSeed(value);
			if (!cli.seed) {
				std::cerr << "Invalid seed: " << value << "\n";
				return 2;
			}
		} else if (arg == "--categories") {
			if (!needValue(i, arg)) return 2;
			std::vector<std::string> categories;
			for (auto category : Strings::Split(argv[++i], ',')) {
				Strings::Trim(category);
				if (!category.empty()) {
					categories.push_back(Strings::ToLower(category));
				}
			}
			cli.categories = categories;
		} else if (arg == "--config" || arg == "-c") {
			if (!needValue(i, arg)) return 2;
			cli.config_file = argv[++i];
		} else if (arg == "--dry-run") {
			cli.dry_run = true;
		} else if (arg == "--create-export-dir") {
			cli.create_export_dir = true;
		} else if (arg == "--help" || arg == "-h") {
			PrintUsage(argv[0]);
			return 1;
		} else if (Strings::BeginsWith(arg, "--log-level=") || Strings::BeginsWith(arg, "--log-module=")) {
			// Handled by InitLogging
		} else {
			std::cerr << "Unknown option: " << arg << "\n";
			PrintUsage(argv[0]);
			return 2;
		}
	}
	return 0;
}

void ApplyCommandLine(const CommandLine& cli, ACC::Combiner::CombinerConfig& cfg) {
	if (cli.import_path) cfg.importPath = *cli.import_path;
	if (cli.export_path) cfg.exportPath = *cli.export_path;
	if (cli.combinations) cfg.combinations = *cli.combinations;
	if (cli.seed) cfg.seed = cli.seed;
	if (cli.categories) {
		cfg.categories = std::set<std::string>(cli.categories->begin(), cli.categories->end());
	}
	if (cli.dry_run) cfg.dryRun = true;
	if (cli.create_export_dir) cfg.createExportDir = true;
}

} // namespace

int main(int argc, char *argv[]) {
	CommandLine cli;
	int parsed = ParseCommandLine(argc, argv, cli);
	if (parsed != 0) {
		return parsed - 1;
	}

	InitLogging(argc, argv);

	auto config = ACC::JsonConfigFile::Load(cli.config_file);
	if (!config.Error().empty()) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse {}: {}", cli.config_file, config.Error());
		return 1;
	}
	if (config.Loaded()) {
		InitLoggingFromJson(config.RawHandle());
		// Command-line levels win over the config file
		InitLogging(argc, argv);
		LOG_INFO(MOD_CONFIG, "Loaded config {}", cli.config_file);
	}

	ACC::Combiner::CombinerConfig cfg;
	std::string error;
	if (!ACC::Combiner::applyJsonConfig(config, cfg, error)) {
		LOG_ERROR(MOD_CONFIG, "{}: {}", cli.config_file, error);
		return 1;
	}
	ApplyCommandLine(cli, cfg);

	error = ACC::Combiner::validateConfig(cfg);
	if (!error.empty()) {
		LOG_ERROR(MOD_CONFIG, "{}", error);
		PrintUsage(argv[0]);
		return 1;
	}

	LOG_INFO(MOD_MAIN, "Combining {} -> {} ({} per skeleton{})", cfg.importPath,
		cfg.dryRun ? "(dry run)" : cfg.exportPath, cfg.combinations,
		cfg.seed ? fmt::format(", seed {}", *cfg.seed) : std::string());

	std::unique_ptr<ACC::Graphics::AssetExportHost> host;
	if (!cfg.dryRun) {
		host = std::make_unique<ACC::Graphics::AssetExportHost>();
		if (!host->canEncodeTextures()) {
			LOG_WARN(MOD_MAIN, "Only PNG and JPEG textures will be embedded");
		}
	}

	ACC::Combiner::ExportCoordinator coordinator(host.get(), cfg);
	ACC::Combiner::ExportReport report;
	try {
		report = coordinator.runFromFolder();
	} catch (const std::invalid_argument& e) {
		LOG_ERROR(MOD_MAIN, "{}", e.what());
		return 1;
	} catch (const std::exception& e) {
		LOG_FATAL(MOD_MAIN, "Run aborted: {}", e.what());
		return 1;
	}

	std::cout << ACC::Combiner::summarizeReport(report);
	if (cfg.dryRun) {
		std::cout << "Planned: " << report.planned.size() << "\n";
		for (const auto& named : report.planned) {
			std::cout << "  " << named.name << "\n";
		}
	}

	return report.hasFailures() ? 2 : 0;
}
