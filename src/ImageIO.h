#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Kiseki {

/**
 * Decoded RGBA8 image, tightly packed rows.
 */
struct DecodedImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;
};

/**
 * Image encoding interface.
 * The editor only ever hands the codec exactly width*height*4 bytes.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    /**
     * Decode an encoded image into RGBA8.
     * @param bytes Encoded file contents
     * @param outError Receives a message on failure (may be null)
     * @return Decoded image, or nullopt on failure
     */
    virtual std::optional<DecodedImage> Decode(
        const std::vector<uint8_t>& bytes,
        std::string* outError
    ) = 0;

    /**
     * Encode RGBA8 pixels.
     * @return Encoded bytes, or nullopt on failure
     */
    virtual std::optional<std::vector<uint8_t>> Encode(
        int width, int height,
        const std::vector<uint8_t>& pixels,
        std::string* outError
    ) = 0;
};

/**
 * PNG codec backed by stb_image / stb_image_write.
 */
class PngCodec : public IImageCodec {
public:
    std::optional<DecodedImage> Decode(
        const std::vector<uint8_t>& bytes,
        std::string* outError
    ) override;

    std::optional<std::vector<uint8_t>> Encode(
        int width, int height,
        const std::vector<uint8_t>& pixels,
        std::string* outError
    ) override;
};

} // namespace Kiseki
