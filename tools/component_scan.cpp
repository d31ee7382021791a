// Component Folder Lister
// Lists the components found under an import folder, grouped by skeleton and
// category, with the number of combinations each skeleton allows.
// Usage: component_scan <folder> [extension...]

#include <iostream>
#include <string>
#include <vector>

#include "combiner/classifier.h"
#include "combiner/combination_generator.h"
#include "combiner/component_scanner.h"
#include "common/logging.h"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <folder> [extension...]" << std::endl;
        return 1;
    }

    InitLogging(argc, argv);

    std::vector<std::string> extensions;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            extensions.push_back(arg);
        }
    }
    if (extensions.empty()) {
        extensions.push_back("fbx");
    }

    ACC::Combiner::ScanResult scan = ACC::Combiner::scanComponents(argv[1], extensions);
    if (!scan.error.empty()) {
        std::cerr << "Failed to scan folder: " << scan.error << std::endl;
        return 1;
    }

    ACC::Combiner::ClassificationResult classified = ACC::Combiner::classifyDiscovered(scan.files);

    std::cout << "Folder: " << argv[1] << std::endl;
    std::cout << "Files: " << scan.files.size() << std::endl;
    std::cout << "Skeletons: " << classified.groups.size() << std::endl;
    std::cout << "---" << std::endl;

    for (const auto& [skeleton, group] : classified.groups) {
        uint64_t combinations = ACC::Combiner::candidateCount(group, {});
        std::cout << skeleton << " (" << group.size() << " parts, "
                  << combinations << " combinations"
                  << (group.hasBody() ? "" : ", no body") << ")" << std::endl;
        for (const auto& [category, parts] : group.byCategory()) {
            std::cout << "  " << category << ": " << parts.size() << std::endl;
            for (const auto& part : parts) {
                std::cout << "    " << ACC::Combiner::descriptorToName(part)
                          << "  " << part.sourcePath << std::endl;
            }
        }
    }

    if (!classified.rejected.empty()) {
        std::cout << "---" << std::endl;
        std::cout << "Rejected: " << classified.rejected.size() << std::endl;
        for (const auto& rejected : classified.rejected) {
            std::cout << "  [" << ACC::Combiner::rejectReasonName(rejected.reason) << "] "
                      << rejected.sourcePath << ": " << rejected.message << std::endl;
        }
    }
    for (const auto& folder : scan.skippedFolders) {
        std::cout << "Skipped folder: " << folder << std::endl;
    }

    return 0;
}
