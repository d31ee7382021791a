#ifndef ACC_GRAPHICS_OUTFIT_ASSEMBLER_H
#define ACC_GRAPHICS_OUTFIT_ASSEMBLER_H

#include "combiner/graphics/asset_geometry.h"

#include <memory>
#include <string>
#include <vector>

namespace ACC {
namespace Graphics {

struct AssemblyResult {
    std::shared_ptr<AssetGeometry> geometry;  // null on failure
    std::string error;
};

// Merge part geometries into one outfit sharing a single skeleton. The first
// part that has joints provides the skeleton; joints of later parts are
// matched to it by name. A part using a joint the shared skeleton lacks is an
// armature mismatch and fails the assembly.
AssemblyResult combineOutfitParts(const std::vector<std::shared_ptr<const AssetGeometry>>& parts,
                                  const std::string& name);

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_OUTFIT_ASSEMBLER_H
