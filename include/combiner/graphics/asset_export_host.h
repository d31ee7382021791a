#ifndef ACC_GRAPHICS_ASSET_EXPORT_HOST_H
#define ACC_GRAPHICS_ASSET_EXPORT_HOST_H

#include "combiner/export_host.h"
#include "combiner/graphics/assimp_importer.h"
#include "combiner/graphics/texture_encoder.h"

#include <map>
#include <memory>
#include <string>

namespace ACC {
namespace Graphics {

// ExportHost that imports parts through assimp and writes each combination as
// a .glb. A part is imported once and shared by every combination of its
// group; releaseParts() drops the cache between groups.
class AssetExportHost : public Combiner::ExportHost {
public:
    AssetExportHost();
    ~AssetExportHost() override;

    AssetExportHost(const AssetExportHost&) = delete;
    AssetExportHost& operator=(const AssetExportHost&) = delete;

    // False when textures other than PNG and JPEG cannot be re-encoded
    bool canEncodeTextures() const { return encoder_ && encoder_->isReady(); }

    Combiner::HostOutcome importPart(const Combiner::PartDescriptor& part) override;
    Combiner::HostOutcome exportCombination(const Combiner::NamedCombination& combination,
                                            const std::string& destinationFolder) override;
    void releaseParts() override;

    size_t cachedPartCount() const { return parts_.size(); }

private:
    std::unique_ptr<TextureEncoder> encoder_;
    std::unique_ptr<AssimpMeshImporter> importer_;
    // Imported geometry by source path
    std::map<std::string, std::shared_ptr<const AssetGeometry>> parts_;
};

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_ASSET_EXPORT_HOST_H
