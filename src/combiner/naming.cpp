#include "combiner/naming.h"
#include "common/logging.h"
#include "common/util/crc64.h"
#include "common/util/strings.h"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace ACC {
namespace Combiner {

namespace {

// Length prefixes keep separators in field text from merging two fields
void appendField(std::string& out, const std::string& field) {
    fmt::format_to(std::back_inserter(out), "{}:{}|", field.size(), field);
}

} // namespace

std::string canonicalIdentity(const Combination& combination) {
    std::vector<PartDescriptor> parts = combination.parts;
    std::sort(parts.begin(), parts.end());

    std::string canonical;
    for (const auto& part : parts) {
        for (const std::string* field : {&part.category, &part.type, &part.skeleton, &part.theme,
                                         &part.variant, &part.meshIndex, &part.region}) {
            appendField(canonical, *field);
        }
        canonical.push_back('\n');
    }
    return canonical;
}

std::string combinationName(const Combination& combination) {
    std::string canonical = canonicalIdentity(combination);
    std::string name = fmt::format("{}{}{}{}{}", kSetPrefix, kTagSeparator, combination.skeleton,
                                   kTagSeparator, Crc64Hex(canonical));
    LOG_TRACE(MOD_NAMING, "{} <- [{}]", name, canonical);
    return name;
}

NamedCombination nameCombination(const Combination& combination) {
    return NamedCombination{combination, combinationName(combination)};
}

std::string skeletonFromName(const std::string& name) {
    std::vector<std::string> tokens = Strings::Split(name, kTagSeparator);
    if (tokens.size() != 3 || tokens[0] != kSetPrefix || tokens[2].size() != kNameHashLength) {
        return {};
    }
    return tokens[1];
}

std::string exportFileName(const std::string& name, const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }
    return Strings::Replace(name, ".", "_") + ext;
}

} // namespace Combiner
} // namespace ACC
