#ifndef ACC_COMBINER_COMBINATION_GENERATOR_H
#define ACC_COMBINER_COMBINATION_GENERATOR_H

#include "combiner/classifier.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ACC {
namespace Combiner {

// One part per category, ordered by category name
struct Combination {
    std::string skeleton;
    std::vector<PartDescriptor> parts;

    const PartDescriptor* part(const std::string& category) const;
    std::vector<std::string> categories() const;
};

// Equal when both map the same categories to the same parts
bool operator==(const Combination& a, const Combination& b);
inline bool operator!=(const Combination& a, const Combination& b) { return !(a == b); }

struct GenerateOptions {
    int64_t count = 10;
    // Categories to combine besides body. Empty means every category in the group.
    std::set<std::string> requiredCategories;
    // Fixed seed for reproducible draws; unset draws from a randomly seeded engine
    std::optional<uint64_t> seed;
    // Throw std::invalid_argument for a group without body instead of skipping it
    bool requireBody = false;
};

// Categories of the group that take part in combinations
std::vector<std::string> selectedCategories(const SkeletonGroup& group,
                                            const std::set<std::string>& requiredCategories);

// Size of the candidate space, saturating at UINT64_MAX. Zero without body.
uint64_t candidateCount(const SkeletonGroup& group,
                        const std::set<std::string>& requiredCategories);

// Draw up to options.count distinct combinations from the group. When the
// candidate space is not larger than the request the whole space is returned
// in lexicographic index order (last category varies fastest).
std::vector<Combination> generateCombinations(const SkeletonGroup& group,
                                              const GenerateOptions& options);

std::vector<Combination> generateCombinations(const SkeletonGroup& group, int64_t count,
                                              const std::set<std::string>& requiredCategories = {},
                                              std::optional<uint64_t> seed = std::nullopt);

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_COMBINATION_GENERATOR_H
