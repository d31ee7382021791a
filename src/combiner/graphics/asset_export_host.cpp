#include "combiner/graphics/asset_export_host.h"
#include "combiner/graphics/glb_writer.h"
#include "combiner/graphics/outfit_assembler.h"
#include "common/logging.h"

#include <vector>

namespace ACC {
namespace Graphics {

namespace {
constexpr const char* kOutputExtension = "glb";
}

AssetExportHost::AssetExportHost()
    : encoder_(std::make_unique<TextureEncoder>()) {
    if (!encoder_->isReady()) {
        LOG_WARN(MOD_GRAPHICS_LOAD, "No image device, only PNG and JPEG textures will be embedded");
        importer_ = std::make_unique<AssimpMeshImporter>(nullptr);
    } else {
        importer_ = std::make_unique<AssimpMeshImporter>(encoder_.get());
    }
}

AssetExportHost::~AssetExportHost() {
    parts_.clear();
    importer_.reset();
    encoder_.reset();
}

Combiner::HostOutcome AssetExportHost::importPart(const Combiner::PartDescriptor& part) {
    if (part.sourcePath.empty()) {
        return Combiner::HostOutcome::failure("part has no source file");
    }
    if (parts_.count(part.sourcePath)) {
        return Combiner::HostOutcome::ok(part.sourcePath);
    }

    std::string error;
    std::shared_ptr<AssetGeometry> geometry = importer_->load(part.sourcePath, error);
    if (!geometry) {
        LOG_WARN(MOD_GRAPHICS_LOAD, "Import of {} failed: {}", part.sourcePath, error);
        return Combiner::HostOutcome::failure(error);
    }
    geometry->name = Combiner::descriptorToName(part);

    LOG_DEBUG(MOD_GRAPHICS_LOAD, "Imported {} as {} ({} joints)",
              part.sourcePath, geometry->name, geometry->joints.size());
    parts_[part.sourcePath] = std::move(geometry);
    return Combiner::HostOutcome::ok(part.sourcePath);
}

Combiner::HostOutcome AssetExportHost::exportCombination(const Combiner::NamedCombination& combination,
                                                        const std::string& destinationFolder) {
    // Body goes first so its armature becomes the shared skeleton
    const Combiner::PartDescriptor* body = combination.combination.part(Combiner::kBodyCategory);
    std::vector<const Combiner::PartDescriptor*> ordered;
    if (body) {
        ordered.push_back(body);
    }
    for (const auto& part : combination.combination.parts) {
        if (&part != body) {
            ordered.push_back(&part);
        }
    }

    std::vector<std::shared_ptr<const AssetGeometry>> geometries;
    for (const Combiner::PartDescriptor* part : ordered) {
        auto it = parts_.find(part->sourcePath);
        if (it == parts_.end()) {
            return Combiner::HostOutcome::failure(
                fmt::format("part '{}' was not imported", Combiner::identityString(*part)));
        }
        geometries.push_back(it->second);
    }

    AssemblyResult assembled = combineOutfitParts(geometries, combination.name);
    if (!assembled.geometry) {
        return Combiner::HostOutcome::failure(assembled.error);
    }

    std::string path = (fs::path(destinationFolder) /
                        Combiner::exportFileName(combination.name, kOutputExtension)).string();

    std::string error;
    if (!GlbWriter::write(*assembled.geometry, path, error)) {
        return Combiner::HostOutcome::failure(error);
    }

    LOG_DEBUG(MOD_EXPORT, "Wrote {} ({} vertices, {} triangles)", path,
              assembled.geometry->vertexCount(), assembled.geometry->triangleCount());
    return Combiner::HostOutcome::ok(path);
}

void AssetExportHost::releaseParts() {
    LOG_TRACE(MOD_GRAPHICS_LOAD, "Releasing {} cached parts", parts_.size());
    parts_.clear();
}

} // namespace Graphics
} // namespace ACC
