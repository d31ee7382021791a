#include "combiner/classifier.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <algorithm>
#include <stdexcept>

namespace ACC {
namespace Combiner {

const char* rejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::ParseFailure:    return "ParseFailure";
        case RejectReason::MissingSkeleton: return "MissingSkeleton";
        case RejectReason::Ignored:         return "Ignored";
        case RejectReason::ImportFailure:   return "ImportFailure";
    }
    return "Unknown";
}

SkeletonGroup::SkeletonGroup(std::string skeleton)
    : skeleton_(std::move(skeleton)) {
}

bool SkeletonGroup::add(const PartDescriptor& part) {
    if (part.skeleton != skeleton_) {
        throw std::invalid_argument(fmt::format(
            "part {} has skeleton '{}', group expects '{}'",
            identityString(part), part.skeleton, skeleton_));
    }

    auto& bucket = parts_[part.category];
    if (std::find(bucket.begin(), bucket.end(), part) != bucket.end()) {
        return false;
    }
    bucket.push_back(part);
    return true;
}

bool SkeletonGroup::remove(const PartDescriptor& part) {
    auto it = parts_.find(part.category);
    if (it == parts_.end()) {
        return false;
    }

    auto& bucket = it->second;
    auto pos = std::find(bucket.begin(), bucket.end(), part);
    if (pos == bucket.end()) {
        return false;
    }
    bucket.erase(pos);
    if (bucket.empty()) {
        parts_.erase(it);
    }
    return true;
}

bool SkeletonGroup::hasCategory(const std::string& category) const {
    return parts_.find(category) != parts_.end();
}

const std::vector<PartDescriptor>& SkeletonGroup::parts(const std::string& category) const {
    static const std::vector<PartDescriptor> empty;
    auto it = parts_.find(category);
    return it != parts_.end() ? it->second : empty;
}

std::vector<std::string> SkeletonGroup::categories() const {
    std::vector<std::string> names;
    names.reserve(parts_.size());
    for (const auto& [category, bucket] : parts_) {
        names.push_back(category);
    }
    return names;
}

size_t SkeletonGroup::size() const {
    size_t total = 0;
    for (const auto& [category, bucket] : parts_) {
        total += bucket.size();
    }
    return total;
}

size_t ClassificationResult::groupedPartCount() const {
    size_t total = 0;
    for (const auto& [skeleton, group] : groups) {
        total += group.size();
    }
    return total;
}

ClassificationResult classify(const std::vector<PartDescriptor>& descriptors) {
    ClassificationResult result;

    for (const auto& part : descriptors) {
        if (!part.hasSkeletonTag()) {
            LOG_WARN(MOD_CLASSIFY, "No skeleton tag on {}, excluding it from combinations",
                     identityString(part));
            result.rejected.push_back(RejectedDescriptor{
                descriptorToName(part), part.category, part.sourcePath, part,
                RejectReason::MissingSkeleton, "missing skeleton tag"});
            continue;
        }

        if (part.region != kDefaultRegion && part.region != part.category) {
            LOG_WARN(MOD_CLASSIFY, "Region mismatch for {}: tagged '{}', found in '{}'",
                     descriptorToName(part), part.region, part.category);
        }

        auto it = result.groups.find(part.skeleton);
        if (it == result.groups.end()) {
            it = result.groups.emplace(part.skeleton, SkeletonGroup(part.skeleton)).first;
        }

        if (!it->second.add(part)) {
            LOG_DEBUG(MOD_CLASSIFY, "Dropping duplicate {}", identityString(part));
            result.duplicates++;
        }
    }

    LOG_INFO(MOD_CLASSIFY, "Classified {} parts into {} skeleton groups, {} rejected, {} duplicates",
             result.groupedPartCount(), result.groups.size(), result.rejected.size(), result.duplicates);
    return result;
}

ClassificationResult classifyDiscovered(const std::vector<DiscoveredFile>& files,
                                        const std::vector<std::string>& ignore) {
    std::vector<std::string> ignored;
    ignored.reserve(ignore.size());
    for (const auto& name : ignore) {
        std::string lowered = Strings::ToLower(name);
        ignored.push_back(lowered.substr(0, lowered.find('.')));
    }

    std::vector<PartDescriptor> descriptors;
    std::vector<RejectedDescriptor> rejected;

    for (const auto& file : files) {
        std::string stem = Strings::ToLower(file.identifier);
        stem = stem.substr(0, stem.find('.'));
        if (Strings::Contains(ignored, stem)) {
            LOG_INFO(MOD_CLASSIFY, "Ignoring {}", file.path);
            rejected.push_back(RejectedDescriptor{
                file.identifier, file.category, file.path, std::nullopt,
                RejectReason::Ignored, "listed in ignore list"});
            continue;
        }

        ParseResult parsed = parseIdentifier(file.identifier, file.category, file.path);
        if (!parsed.ok()) {
            LOG_WARN(MOD_PARSE, "Cannot parse '{}' ({}): {}", file.identifier, file.path,
                     parsed.failure.reason);
            rejected.push_back(RejectedDescriptor{
                file.identifier, file.category, file.path, std::nullopt,
                RejectReason::ParseFailure, parsed.failure.reason});
            continue;
        }
        descriptors.push_back(std::move(*parsed.descriptor));
    }

    ClassificationResult result = classify(descriptors);
    result.rejected.insert(result.rejected.begin(), rejected.begin(), rejected.end());
    return result;
}

} // namespace Combiner
} // namespace ACC
