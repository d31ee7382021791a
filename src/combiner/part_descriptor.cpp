#include "combiner/part_descriptor.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <algorithm>
#include <iterator>
#include <vector>

namespace ACC {
namespace Combiner {

ParseResult parseIdentifier(const std::string& rawIdentifier, const std::string& category,
                            const std::string& sourcePath) {
    ParseResult result;
    result.failure.identifier = rawIdentifier;

    std::string stem = Strings::ToLower(rawIdentifier);
    size_t dotPos = stem.find('.');
    if (dotPos != std::string::npos) {
        stem = stem.substr(0, dotPos);
    }

    if (stem.empty()) {
        result.failure.reason = "empty identifier";
        return result;
    }
    if (stem.find(kTagSeparator) == std::string::npos) {
        result.failure.reason = fmt::format("no '{}' separator in identifier", kTagSeparator);
        return result;
    }
    if (category.empty() || category.find(kTagSeparator) != std::string::npos) {
        result.failure.reason = fmt::format("invalid category '{}'", category);
        return result;
    }

    // Keep empty tokens so tags stay in position ("a--b" has an empty theme slot)
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t end = stem.find(kTagSeparator);
    while (end != std::string::npos) {
        tokens.push_back(stem.substr(start, end - start));
        start = end + 1;
        end = stem.find(kTagSeparator, start);
    }
    tokens.push_back(stem.substr(start));

    PartDescriptor part;
    part.category = category;
    part.sourcePath = sourcePath;

    std::string* fields[] = {
        &part.type, &part.skeleton, &part.theme, &part.variant, &part.meshIndex, &part.region
    };
    size_t count = std::min(tokens.size(), std::size(fields));
    for (size_t i = 0; i < count; i++) {
        if (!tokens[i].empty()) {
            *fields[i] = tokens[i];
        }
    }

    if (tokens.size() > std::size(fields)) {
        LOG_DEBUG(MOD_PARSE, "Identifier '{}' has {} extra tags, ignoring them",
                  rawIdentifier, tokens.size() - std::size(fields));
    }

    LOG_TRACE(MOD_PARSE, "Parsed '{}' as {}", rawIdentifier, identityString(part));
    result.descriptor = std::move(part);
    return result;
}

std::string descriptorToName(const PartDescriptor& part) {
    return Strings::Join({part.type, part.skeleton, part.theme, part.variant,
                          part.meshIndex, part.region},
                         std::string(1, kTagSeparator));
}

std::string identityString(const PartDescriptor& part) {
    return part.category + ":" + descriptorToName(part);
}

} // namespace Combiner
} // namespace ACC
