#include "ImageIO.h"

// stb_image for PNG decoding
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

// stb_image_write for PNG encoding
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace Kiseki {

namespace {

// Memory writer callback for stb_image_write
struct MemoryWriter {
    std::vector<uint8_t> data;

    static void callback(void* context, void* data, int size) {
        MemoryWriter* writer = static_cast<MemoryWriter*>(context);
        uint8_t* bytes = static_cast<uint8_t*>(data);
        writer->data.insert(writer->data.end(), bytes, bytes + size);
    }
};

void SetError(std::string* outError, const std::string& message) {
    if (outError) {
        *outError = message;
    }
}

} // namespace

std::optional<DecodedImage> PngCodec::Decode(
    const std::vector<uint8_t>& bytes,
    std::string* outError
) {
    if (bytes.empty()) {
        SetError(outError, "Image file is empty");
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int channels = 0;

    // Always request 4 channels so the result is RGBA8
    unsigned char* data = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()),
        &width, &height, &channels, 4
    );
    if (!data) {
        const char* reason = stbi_failure_reason();
        SetError(outError, std::string("Failed to decode image: ") +
                 (reason ? reason : "unknown error"));
        return std::nullopt;
    }

    DecodedImage image;
    image.width = width;
    image.height = height;
    image.pixels.assign(
        data, data + static_cast<size_t>(width) * height * 4
    );
    stbi_image_free(data);

    return image;
}

std::optional<std::vector<uint8_t>> PngCodec::Encode(
    int width, int height,
    const std::vector<uint8_t>& pixels,
    std::string* outError
) {
    if (width <= 0 || height <= 0 ||
        pixels.size() != static_cast<size_t>(width) * height * 4) {
        SetError(outError, "Pixel data does not match image dimensions");
        return std::nullopt;
    }

    MemoryWriter writer;
    int result = stbi_write_png_to_func(
        MemoryWriter::callback,
        &writer,
        width, height, 4,
        pixels.data(),
        width * 4
    );
    if (result == 0) {
        SetError(outError, "Failed to encode PNG");
        return std::nullopt;
    }

    return writer.data;
}

} // namespace Kiseki
