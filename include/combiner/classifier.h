#ifndef ACC_COMBINER_CLASSIFIER_H
#define ACC_COMBINER_CLASSIFIER_H

#include "combiner/part_descriptor.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ACC {
namespace Combiner {

enum class RejectReason {
    ParseFailure,     // identifier could not be parsed
    MissingSkeleton,  // no skeleton tag, cannot be grouped safely
    Ignored,          // excluded by the ignore list
    ImportFailure     // the host could not load the part
};

const char* rejectReasonName(RejectReason reason);

struct RejectedDescriptor {
    std::string identifier;
    std::string category;
    std::string sourcePath;
    std::optional<PartDescriptor> descriptor;  // unset for parse failures
    RejectReason reason;
    std::string message;
};

// Parts sharing one skeleton tag, bucketed by category. Categories enumerate in
// name order, parts within a category in insertion order.
class SkeletonGroup {
public:
    SkeletonGroup() = default;
    explicit SkeletonGroup(std::string skeleton);

    const std::string& skeleton() const { return skeleton_; }

    // Returns false for a part whose identity is already present.
    // Throws std::invalid_argument for a part with a different skeleton tag.
    bool add(const PartDescriptor& part);
    bool remove(const PartDescriptor& part);

    bool hasCategory(const std::string& category) const;
    bool hasBody() const { return hasCategory(kBodyCategory); }
    const std::vector<PartDescriptor>& parts(const std::string& category) const;
    std::vector<std::string> categories() const;
    const std::map<std::string, std::vector<PartDescriptor>>& byCategory() const { return parts_; }

    size_t size() const;
    bool empty() const { return parts_.empty(); }

private:
    std::string skeleton_;
    std::map<std::string, std::vector<PartDescriptor>> parts_;
};

struct ClassificationResult {
    std::map<std::string, SkeletonGroup> groups;  // keyed by skeleton tag
    std::vector<RejectedDescriptor> rejected;
    size_t duplicates = 0;

    size_t groupedPartCount() const;
};

// Group descriptors by skeleton then category. Descriptors without a skeleton
// tag are rejected; repeated identities are dropped.
ClassificationResult classify(const std::vector<PartDescriptor>& descriptors);

// Parse scanner output and classify it. Identifiers listed in ignore (compared
// lowercased, without extension) are rejected before parsing.
ClassificationResult classifyDiscovered(const std::vector<DiscoveredFile>& files,
                                        const std::vector<std::string>& ignore = {});

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_CLASSIFIER_H
