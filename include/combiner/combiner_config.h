#ifndef ACC_COMBINER_CONFIG_H
#define ACC_COMBINER_CONFIG_H

#include "common/util/json_config.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ACC {
namespace Combiner {

// Everything a batch run needs, validated before it reaches the coordinator
struct CombinerConfig {
    std::string importPath;
    std::string exportPath;
    int64_t combinations = 10;
    std::set<std::string> categories;       // empty combines every category
    std::optional<uint64_t> seed;
    std::vector<std::string> extensions = {"fbx"};
    std::vector<std::string> ignore;        // identifiers left out of combinations
    bool createExportDir = false;
    bool dryRun = false;
};

// Copy recognized keys from a config file over cfg. Returns false and sets
// error when a present key has an unusable value.
bool applyJsonConfig(const JsonConfigFile& file, CombinerConfig& cfg, std::string& error);

// Command-line integer values. nullopt when the text is not a whole number or
// does not fit; negative counts parse and are left to validateConfig.
std::optional<int64_t> parseCombinationCount(const std::string& value);
std::optional<uint64_t> parseSeed(const std::string& value);

// Checks a config is complete enough to run. Returns an empty string when valid.
std::string validateConfig(const CombinerConfig& cfg);

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_CONFIG_H
