#ifndef ACC_COMBINER_NAMING_H
#define ACC_COMBINER_NAMING_H

#include "combiner/combination_generator.h"

#include <string>

namespace ACC {
namespace Combiner {

// Leading tag of every output name
inline const std::string kSetPrefix = "set";

// Hex digits of the content hash in an output name
constexpr size_t kNameHashLength = 16;

struct NamedCombination {
    Combination combination;
    std::string name;
};

// Parts sorted by category then identity. Each part is one line of
// length-prefixed fields, category first: "4:body|4:skin|1:f|...|4:body|\n".
std::string canonicalIdentity(const Combination& combination);

// "set-<skeleton>-<crc64 hex of canonicalIdentity>"
std::string combinationName(const Combination& combination);

NamedCombination nameCombination(const Combination& combination);

// Skeleton tag of an output name, empty if the name is not a set name
std::string skeletonFromName(const std::string& name);

// File name for an exported set. Dots in the name become underscores.
std::string exportFileName(const std::string& name, const std::string& extension);

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_NAMING_H
