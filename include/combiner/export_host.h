#ifndef ACC_COMBINER_EXPORT_HOST_H
#define ACC_COMBINER_EXPORT_HOST_H

#include "combiner/naming.h"

#include <string>
#include <utility>

namespace ACC {
namespace Combiner {

struct HostOutcome {
    bool success = false;
    std::string path;    // written file on export success
    std::string reason;  // set on failure

    static HostOutcome ok(std::string path = {}) { return HostOutcome{true, std::move(path), {}}; }
    static HostOutcome failure(std::string reason) { return HostOutcome{false, {}, std::move(reason)}; }
};

// The 3D import/assembly/export collaborator. Calls are made one at a time.
class ExportHost {
public:
    virtual ~ExportHost() = default;

    // Load a part so later exports can reference it
    virtual HostOutcome importPart(const PartDescriptor& part) = 0;

    // Assemble the parts of one combination and write it to destinationFolder
    virtual HostOutcome exportCombination(const NamedCombination& combination,
                                          const std::string& destinationFolder) = 0;

    // Drop parts imported for the group that just finished
    virtual void releaseParts() {}
};

} // namespace Combiner
} // namespace ACC

#endif // ACC_COMBINER_EXPORT_HOST_H
