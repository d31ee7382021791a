#include "combiner/combination_generator.h"
#include "common/logging.h"
#include "common/util/random.h"

#include <limits>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace ACC {
namespace Combiner {

namespace {

using IndexTuple = std::vector<size_t>;

Combination buildCombination(const SkeletonGroup& group,
                             const std::vector<std::string>& categories,
                             const IndexTuple& indices) {
    Combination combination;
    combination.skeleton = group.skeleton();
    combination.parts.reserve(categories.size());
    for (size_t i = 0; i < categories.size(); i++) {
        combination.parts.push_back(group.parts(categories[i])[indices[i]]);
    }
    return combination;
}

// Mixed-radix decode, last category is the least significant digit
IndexTuple decodeIndex(uint64_t linear, const std::vector<size_t>& counts) {
    IndexTuple indices(counts.size(), 0);
    for (size_t i = counts.size(); i-- > 0;) {
        indices[i] = static_cast<size_t>(linear % counts[i]);
        linear /= counts[i];
    }
    return indices;
}

// Robert Floyd's sampling: count distinct values from [0, space)
std::vector<uint64_t> sampleDistinct(uint64_t space, uint64_t count, Random& rng) {
    std::unordered_set<uint64_t> seen;
    std::vector<uint64_t> drawn;
    drawn.reserve(static_cast<size_t>(count));
    for (uint64_t j = space - count; j < space; j++) {
        uint64_t t = rng.Index(0, j);
        if (seen.insert(t).second) {
            drawn.push_back(t);
        } else {
            seen.insert(j);
            drawn.push_back(j);
        }
    }
    // Floyd's set is uniform, its insertion order is not
    rng.Shuffle(drawn.begin(), drawn.end());
    return drawn;
}

} // namespace

const PartDescriptor* Combination::part(const std::string& category) const {
    for (const auto& p : parts) {
        if (p.category == category) {
            return &p;
        }
    }
    return nullptr;
}

std::vector<std::string> Combination::categories() const {
    std::vector<std::string> names;
    names.reserve(parts.size());
    for (const auto& p : parts) {
        names.push_back(p.category);
    }
    return names;
}

bool operator==(const Combination& a, const Combination& b) {
    if (a.skeleton != b.skeleton || a.parts.size() != b.parts.size()) {
        return false;
    }

    std::map<std::string, const PartDescriptor*> lhs;
    for (const auto& p : a.parts) {
        lhs[p.category] = &p;
    }
    for (const auto& p : b.parts) {
        auto it = lhs.find(p.category);
        if (it == lhs.end() || *it->second != p) {
            return false;
        }
    }
    return lhs.size() == b.parts.size();
}

std::vector<std::string> selectedCategories(const SkeletonGroup& group,
                                            const std::set<std::string>& requiredCategories) {
    std::vector<std::string> selected;
    for (const auto& category : group.categories()) {
        if (requiredCategories.empty() || category == kBodyCategory ||
            requiredCategories.count(category) > 0) {
            selected.push_back(category);
        }
    }
    return selected;
}

uint64_t candidateCount(const SkeletonGroup& group,
                        const std::set<std::string>& requiredCategories) {
    if (!group.hasBody()) {
        return 0;
    }

    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t total = 1;
    for (const auto& category : selectedCategories(group, requiredCategories)) {
        uint64_t n = group.parts(category).size();
        if (n == 0) {
            return 0;
        }
        if (total > kMax / n) {
            return kMax;
        }
        total *= n;
    }
    return total;
}

std::vector<Combination> generateCombinations(const SkeletonGroup& group,
                                              const GenerateOptions& options) {
    if (options.count < 0) {
        throw std::invalid_argument(fmt::format(
            "combination count must not be negative, got {}", options.count));
    }

    if (!group.hasBody()) {
        if (options.requireBody) {
            throw std::invalid_argument(fmt::format(
                "skeleton group '{}' has no '{}' parts", group.skeleton(), kBodyCategory));
        }
        LOG_WARN(MOD_COMBINE, "Skipping skeleton '{}': no '{}' parts", group.skeleton(), kBodyCategory);
        return {};
    }

    std::vector<Combination> combinations;
    if (options.count == 0) {
        return combinations;
    }

    std::vector<std::string> categories = selectedCategories(group, options.requiredCategories);
    std::vector<size_t> counts;
    counts.reserve(categories.size());
    for (const auto& category : categories) {
        counts.push_back(group.parts(category).size());
    }

    const uint64_t space = candidateCount(group, options.requiredCategories);
    const uint64_t requested = static_cast<uint64_t>(options.count);

    if (requested >= space) {
        LOG_DEBUG(MOD_COMBINE, "Skeleton '{}': {} requested, returning all {} combinations",
                  group.skeleton(), requested, space);
        combinations.reserve(static_cast<size_t>(space));
        for (uint64_t linear = 0; linear < space; linear++) {
            combinations.push_back(buildCombination(group, categories, decodeIndex(linear, counts)));
        }
        return combinations;
    }

    Random rng;
    if (options.seed) {
        rng.Reseed(*options.seed);
    }

    combinations.reserve(static_cast<size_t>(requested));
    if (space == std::numeric_limits<uint64_t>::max()) {
        // Space too large to index linearly; draw tuples and reject repeats
        std::set<IndexTuple> seen;
        while (combinations.size() < requested) {
            IndexTuple indices(counts.size());
            for (size_t i = 0; i < counts.size(); i++) {
                indices[i] = static_cast<size_t>(rng.Index(0, counts[i] - 1));
            }
            if (seen.insert(indices).second) {
                combinations.push_back(buildCombination(group, categories, indices));
            }
        }
    } else {
        for (uint64_t linear : sampleDistinct(space, requested, rng)) {
            combinations.push_back(buildCombination(group, categories, decodeIndex(linear, counts)));
        }
    }

    LOG_DEBUG(MOD_COMBINE, "Skeleton '{}': drew {} of {} combinations",
              group.skeleton(), combinations.size(), space);
    return combinations;
}

std::vector<Combination> generateCombinations(const SkeletonGroup& group, int64_t count,
                                              const std::set<std::string>& requiredCategories,
                                              std::optional<uint64_t> seed) {
    GenerateOptions options;
    options.count = count;
    options.requiredCategories = requiredCategories;
    options.seed = seed;
    return generateCombinations(group, options);
}

} // namespace Combiner
} // namespace ACC
