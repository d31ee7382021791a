#ifndef ACC_COMBINER_EXPORT_COORDINATOR_H
#define ACC_COMBINER_EXPORT_COORDINATOR_H

#include "combiner/classifier.h"
#include "combiner/combiner_config.h"
#include "combiner/export_host.h"
#include "combiner/naming.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ACC {
namespace Combiner {

struct ExportedSet {
    std::string name;
    std::string skeleton;
    std::string path;
};

struct FailedExport {
    std::string name;
    std::string skeleton;
    std::string reason;
};

struct SkippedGroup {
    std::string skeleton;
    std::string reason;
};

// Fewer combinations existed than were requested for a skeleton
struct TruncationNotice {
    std::string skeleton;
    uint64_t requested = 0;
    uint64_t available = 0;
};

struct ExportReport {
    std::vector<ExportedSet> exported;
    std::vector<FailedExport> failed;
    std::vector<RejectedDescriptor> rejected;
    std::vector<SkippedGroup> skipped;
    std::vector<TruncationNotice> truncated;
    std::vector<NamedCombination> planned;  // every named combination, exported or not
    size_t duplicateNames = 0;

    bool hasFailures() const { return !failed.empty(); }
};

// Human-readable multi-line summary of a report
std::string summarizeReport(const ExportReport& report);

class ExportCoordinator {
public:
    // host may be null for dry runs
    ExportCoordinator(ExportHost* host, CombinerConfig config);

    const CombinerConfig& config() const { return config_; }

    // Import, generate, name and export every group. Rejections from earlier
    // stages are carried into the report. Throws std::invalid_argument for a
    // negative combination count, or when exporting without a usable export
    // folder or host.
    ExportReport run(const std::map<std::string, SkeletonGroup>& groups,
                     std::vector<RejectedDescriptor> rejected = {});

    // Scan config().importPath, classify what was found, then run().
    // Throws std::invalid_argument when the import folder cannot be scanned.
    ExportReport runFromFolder();

private:
    void processGroup(SkeletonGroup group, ExportReport& report,
                      std::set<std::string>& exportedNames);
    void importGroup(SkeletonGroup& group, ExportReport& report);
    void prepareExportFolder() const;

    ExportHost* host_;
    CombinerConfig config_;
};

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_EXPORT_COORDINATOR_H
