#include "combiner/graphics/texture_encoder.h"
#include "common/logging.h"
#include "common/util/file.h"

#include <filesystem>
#include <system_error>

namespace ACC {
namespace Graphics {

std::string embeddableMimeType(const std::string& data) {
    static const std::string kPngSignature("\x89PNG\r\n\x1a\n", 8);
    static const std::string kJpegSignature("\xFF\xD8\xFF", 3);

    if (data.compare(0, kPngSignature.size(), kPngSignature) == 0) {
        return "image/png";
    }
    if (data.compare(0, kJpegSignature.size(), kJpegSignature) == 0) {
        return "image/jpeg";
    }
    return {};
}

TextureEncoder::TextureEncoder() {
    irr::SIrrlichtCreationParameters params;
    params.DriverType = irr::video::EDT_NULL;
    params.WindowSize = irr::core::dimension2d<irr::u32>(1, 1);
    params.LoggingLevel = irr::ELL_NONE;

    device_ = irr::createDeviceEx(params);
    if (!device_) {
        LOG_ERROR(MOD_GRAPHICS_LOAD, "Failed to create Irrlicht null device");
        return;
    }
    driver_ = device_->getVideoDriver();
}

TextureEncoder::~TextureEncoder() {
    driver_ = nullptr;
    if (device_) {
        device_->drop();
        device_ = nullptr;
    }
}

bool TextureEncoder::encodeFile(const std::string& path, std::string& png, std::string& error) {
    if (!driver_) {
        error = "no image device";
        return false;
    }

    irr::video::IImage* image = driver_->createImageFromFile(path.c_str());
    if (!image) {
        error = fmt::format("cannot decode image {}", path);
        return false;
    }
    return writePng(image, png, error);
}

bool TextureEncoder::encodeData(const std::string& data, const std::string& nameHint,
                                std::string& png, std::string& error) {
    if (!driver_) {
        error = "no image device";
        return false;
    }
    if (data.empty()) {
        error = fmt::format("no image data for {}", nameHint);
        return false;
    }

    // The memory file only reads from the buffer
    irr::io::IReadFile* file = device_->getFileSystem()->createMemoryReadFile(
        const_cast<char*>(data.data()), static_cast<irr::s32>(data.size()), nameHint.c_str(), false);
    if (!file) {
        error = fmt::format("cannot open image data for {}", nameHint);
        return false;
    }

    irr::video::IImage* image = driver_->createImageFromFile(file);
    file->drop();
    if (!image) {
        error = fmt::format("cannot decode image {}", nameHint);
        return false;
    }
    return writePng(image, png, error);
}

bool TextureEncoder::encodePixels(const uint8_t* bgra, uint32_t width, uint32_t height,
                                  std::string& png, std::string& error) {
    if (!driver_) {
        error = "no image device";
        return false;
    }
    if (!bgra || width == 0 || height == 0) {
        error = "empty texel data";
        return false;
    }

    // A8R8G8B8 is stored as B, G, R, A bytes; the texels are copied
    irr::video::IImage* image = driver_->createImageFromData(
        irr::video::ECF_A8R8G8B8, irr::core::dimension2d<irr::u32>(width, height),
        const_cast<uint8_t*>(bgra), false, false);
    if (!image) {
        error = fmt::format("cannot create {}x{} image", width, height);
        return false;
    }
    return writePng(image, png, error);
}

bool TextureEncoder::writePng(irr::video::IImage* image, std::string& png, std::string& error) {
    fs::path temp = fs::temp_directory_path() /
        fmt::format("acc_texture_{:016x}.png", random_.Index(0, UINT64_MAX));

    bool written = driver_->writeImageToFile(image, temp.string().c_str());
    image->drop();
    if (!written) {
        error = fmt::format("cannot write PNG to {}", temp.string());
        return false;
    }

    FileContentsResult contents = File::GetContents(temp.string());
    std::error_code ec;
    fs::remove(temp, ec);
    if (!contents.error.empty() || contents.contents.empty()) {
        error = contents.error.empty() ? "PNG encoder produced no data" : contents.error;
        return false;
    }

    png = std::move(contents.contents);
    return true;
}

} // namespace Graphics
} // namespace ACC
