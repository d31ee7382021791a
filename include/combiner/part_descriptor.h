#ifndef ACC_COMBINER_PART_DESCRIPTOR_H
#define ACC_COMBINER_PART_DESCRIPTOR_H

#include <optional>
#include <string>
#include <tuple>

namespace ACC {
namespace Combiner {

// Separates the tags of a component file name, e.g. "outfit-f-casual-01-v2-bottom"
constexpr char kTagSeparator = '-';

// Defaults for tags missing from the end of a file name
inline const std::string kDefaultType = "undefined";
inline const std::string kDefaultSkeleton = "x";
inline const std::string kDefaultTheme = "generic";
inline const std::string kDefaultVariant = "01";
inline const std::string kDefaultMesh = "v1";
inline const std::string kDefaultRegion = "undefined";

// The category every combination must contain
inline const std::string kBodyCategory = "body";

// One discovered component. Everything except sourcePath is identity.
struct PartDescriptor {
    std::string category;
    std::string type = kDefaultType;
    std::string skeleton = kDefaultSkeleton;
    std::string theme = kDefaultTheme;
    std::string variant = kDefaultVariant;
    std::string meshIndex = kDefaultMesh;
    std::string region = kDefaultRegion;
    std::string sourcePath;

    auto identity() const {
        return std::tie(category, type, skeleton, theme, variant, meshIndex, region);
    }

    bool hasSkeletonTag() const { return skeleton != kDefaultSkeleton; }

    // Region tag for display; untagged files take the folder category
    const std::string& displayRegion() const {
        return region == kDefaultRegion ? category : region;
    }
};

inline bool operator==(const PartDescriptor& a, const PartDescriptor& b) {
    return a.identity() == b.identity();
}

inline bool operator!=(const PartDescriptor& a, const PartDescriptor& b) {
    return !(a == b);
}

inline bool operator<(const PartDescriptor& a, const PartDescriptor& b) {
    return a.identity() < b.identity();
}

// A component file found below the import root
struct DiscoveredFile {
    std::string category;    // first-level folder name
    std::string identifier;  // file name stem
    std::string path;
};

struct ParseFailure {
    std::string identifier;
    std::string reason;
};

// Either a descriptor or the reason parsing failed
struct ParseResult {
    std::optional<PartDescriptor> descriptor;
    ParseFailure failure;

    bool ok() const { return descriptor.has_value(); }
};

// Parse a file name stem into a descriptor. Tags are read in order
// type, skeleton, theme, variant, mesh, region; missing trailing tags take the
// defaults above. Anything after the first '.' is dropped and the identifier is
// lowercased. Fails only for an empty identifier or one without a separator.
ParseResult parseIdentifier(const std::string& rawIdentifier, const std::string& category,
                            const std::string& sourcePath = "");

// Dash-joined tag string, e.g. "outfit-f-casual-01-v2-bottom"
std::string descriptorToName(const PartDescriptor& part);

// Category plus tag string; unique per identity
std::string identityString(const PartDescriptor& part);

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_PART_DESCRIPTOR_H
