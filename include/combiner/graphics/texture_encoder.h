#ifndef ACC_GRAPHICS_TEXTURE_ENCODER_H
#define ACC_GRAPHICS_TEXTURE_ENCODER_H

#include "common/util/random.h"

#include <irrlicht.h>

#include <cstdint>
#include <string>

namespace ACC {
namespace Graphics {

// "image/png" or "image/jpeg" when data starts with that format's signature,
// empty otherwise
std::string embeddableMimeType(const std::string& data);

// Re-encodes images glTF cannot embed (TGA, BMP, DDS, PSD, raw texels) as PNG
// through the image loaders and writers of a headless Irrlicht device.
class TextureEncoder {
public:
    TextureEncoder();
    ~TextureEncoder();

    TextureEncoder(const TextureEncoder&) = delete;
    TextureEncoder& operator=(const TextureEncoder&) = delete;

    bool isReady() const { return driver_ != nullptr; }

    bool encodeFile(const std::string& path, std::string& png, std::string& error);

    // nameHint only needs the extension the data was stored with
    bool encodeData(const std::string& data, const std::string& nameHint,
                    std::string& png, std::string& error);

    // 8-bit BGRA texels, top row first
    bool encodePixels(const uint8_t* bgra, uint32_t width, uint32_t height,
                      std::string& png, std::string& error);

private:
    bool writePng(irr::video::IImage* image, std::string& png, std::string& error);

    irr::IrrlichtDevice* device_ = nullptr;
    irr::video::IVideoDriver* driver_ = nullptr;
    Random random_;
};

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_TEXTURE_ENCODER_H
