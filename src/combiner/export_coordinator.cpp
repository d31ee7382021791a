#include "combiner/export_coordinator.h"
#include "combiner/combination_generator.h"
#include "combiner/component_scanner.h"
#include "common/logging.h"
#include "common/util/file.h"

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <stdexcept>

namespace ACC {
namespace Combiner {

ExportCoordinator::ExportCoordinator(ExportHost* host, CombinerConfig config)
    : host_(host), config_(std::move(config)) {
}

void ExportCoordinator::prepareExportFolder() const {
    if (config_.exportPath.empty()) {
        throw std::invalid_argument("no export folder configured");
    }
    if (File::IsDirectory(config_.exportPath)) {
        return;
    }
    if (!config_.createExportDir) {
        throw std::invalid_argument(fmt::format(
            "export destination '{}' is not a directory", config_.exportPath));
    }
    if (!File::Makedir(config_.exportPath)) {
        throw std::invalid_argument(fmt::format(
            "cannot create export folder '{}'", config_.exportPath));
    }
    LOG_INFO(MOD_EXPORT, "Created export folder {}", config_.exportPath);
}

ExportReport ExportCoordinator::run(const std::map<std::string, SkeletonGroup>& groups,
                                    std::vector<RejectedDescriptor> rejected) {
    if (config_.combinations < 0) {
        throw std::invalid_argument(fmt::format(
            "combination count must not be negative, got {}", config_.combinations));
    }
    if (!config_.dryRun) {
        if (!host_) {
            throw std::invalid_argument("no export host to export with");
        }
        prepareExportFolder();
    }

    ExportReport report;
    report.rejected = std::move(rejected);

    std::set<std::string> exportedNames;
    for (const auto& [skeleton, group] : groups) {
        processGroup(group, report, exportedNames);
        // Groups share no parts
        if (!config_.dryRun) {
            host_->releaseParts();
        }
    }

    LOG_INFO(MOD_EXPORT, "Run finished: {} exported, {} failed, {} rejected",
             report.exported.size(), report.failed.size(), report.rejected.size());
    return report;
}

ExportReport ExportCoordinator::runFromFolder() {
    ScanResult scan = scanComponents(config_.importPath, config_.extensions);
    if (!scan.error.empty()) {
        throw std::invalid_argument(scan.error);
    }

    ClassificationResult classified = classifyDiscovered(scan.files, config_.ignore);
    return run(classified.groups, std::move(classified.rejected));
}

void ExportCoordinator::importGroup(SkeletonGroup& group, ExportReport& report) {
    std::vector<PartDescriptor> failedParts;

    for (const auto& [category, parts] : group.byCategory()) {
        for (const auto& part : parts) {
            HostOutcome outcome;
            try {
                outcome = host_->importPart(part);
            } catch (const std::exception& e) {
                outcome = HostOutcome::failure(e.what());
            }
            if (outcome.success) {
                continue;
            }

            LOG_WARN(MOD_EXPORT, "Import of {} failed: {}", part.sourcePath, outcome.reason);
            report.rejected.push_back(RejectedDescriptor{
                descriptorToName(part), part.category, part.sourcePath, part,
                RejectReason::ImportFailure, outcome.reason});
            failedParts.push_back(part);
        }
    }

    for (const auto& part : failedParts) {
        group.remove(part);
    }
}

void ExportCoordinator::processGroup(SkeletonGroup group, ExportReport& report,
                                     std::set<std::string>& exportedNames) {
    const std::string skeleton = group.skeleton();

    if (!config_.dryRun) {
        importGroup(group, report);
    }

    if (!group.hasBody()) {
        LOG_WARN(MOD_EXPORT, "Skipping skeleton '{}': no '{}' parts", skeleton, kBodyCategory);
        report.skipped.push_back(SkippedGroup{
            skeleton, fmt::format("no '{}' parts", kBodyCategory)});
        return;
    }

    const uint64_t available = candidateCount(group, config_.categories);
    const uint64_t requested = static_cast<uint64_t>(config_.combinations);
    if (requested > available) {
        LOG_INFO(MOD_EXPORT, "Skeleton '{}': {} combinations requested, only {} exist",
                 skeleton, requested, available);
        report.truncated.push_back(TruncationNotice{skeleton, requested, available});
    }

    GenerateOptions options;
    options.count = config_.combinations;
    options.requiredCategories = config_.categories;
    options.seed = config_.seed;
    std::vector<Combination> combinations = generateCombinations(group, options);

    for (const auto& combination : combinations) {
        NamedCombination named = nameCombination(combination);
        report.planned.push_back(named);

        if (config_.dryRun) {
            continue;
        }

        if (!exportedNames.insert(named.name).second) {
            LOG_WARN(MOD_EXPORT, "{} already exported in this run, skipping", named.name);
            report.duplicateNames++;
            continue;
        }

        HostOutcome outcome;
        try {
            outcome = host_->exportCombination(named, config_.exportPath);
        } catch (const std::exception& e) {
            outcome = HostOutcome::failure(e.what());
        }

        if (outcome.success) {
            LOG_INFO(MOD_EXPORT, "Exported {} to {}", named.name, outcome.path);
            report.exported.push_back(ExportedSet{named.name, skeleton, outcome.path});
        } else {
            LOG_WARN(MOD_EXPORT, "Failed to export {}: {}", named.name, outcome.reason);
            exportedNames.erase(named.name);
            report.failed.push_back(FailedExport{named.name, skeleton, outcome.reason});
        }
    }
}

std::string summarizeReport(const ExportReport& report) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Exported: {}\n", report.exported.size());
    for (const auto& e : report.exported) {
        fmt::format_to(it, "  {} -> {}\n", e.name, e.path);
    }

    fmt::format_to(it, "Failed: {}\n", report.failed.size());
    for (const auto& f : report.failed) {
        fmt::format_to(it, "  {}: {}\n", f.name, f.reason);
    }

    fmt::format_to(it, "Rejected: {}\n", report.rejected.size());
    for (const auto& r : report.rejected) {
        fmt::format_to(it, "  [{}] {}: {}\n", rejectReasonName(r.reason),
                       r.sourcePath.empty() ? r.identifier : r.sourcePath, r.message);
    }

    if (!report.skipped.empty()) {
        fmt::format_to(it, "Skipped skeletons: {}\n", report.skipped.size());
        for (const auto& s : report.skipped) {
            fmt::format_to(it, "  {}: {}\n", s.skeleton, s.reason);
        }
    }

    if (!report.truncated.empty()) {
        fmt::format_to(it, "Truncated: {}\n", report.truncated.size());
        for (const auto& t : report.truncated) {
            fmt::format_to(it, "  {}: requested {}, only {} exist\n", t.skeleton, t.requested, t.available);
        }
    }

    return fmt::to_string(out);
}

} // namespace Combiner
} // namespace ACC
