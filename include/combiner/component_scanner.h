#ifndef ACC_COMBINER_COMPONENT_SCANNER_H
#define ACC_COMBINER_COMPONENT_SCANNER_H

#include "combiner/part_descriptor.h"

#include <string>
#include <vector>

namespace ACC {
namespace Combiner {

struct ScanResult {
    std::vector<DiscoveredFile> files;          // sorted by path
    std::vector<std::string> skippedFolders;    // hidden or non-conforming folder names
    std::string error;                          // set when the root cannot be scanned
};

// Names of the first-level folders under root, lowercased, hidden ones excluded
std::vector<std::string> listCategoryFolders(const std::string& root);

// Collect component files below root. The first folder level is the category;
// files are matched by extension (case-insensitive, no leading dot needed) at
// any depth below it. Folders whose name contains the tag separator cannot be
// categories and are skipped.
ScanResult scanComponents(const std::string& root, const std::vector<std::string>& extensions);

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_COMPONENT_SCANNER_H
