#include "ImageIO.h"
#include "EditorSession.h"
#include "EditorState.h"
#include <gtest/gtest.h>

using namespace Kiseki;

TEST(ImageIOTest, EncodedPngHasSignature) {
    PngCodec codec;
    std::vector<uint8_t> pixels(2 * 2 * 4, 255);

    std::string error;
    auto bytes = codec.Encode(2, 2, pixels, &error);
    ASSERT_TRUE(bytes.has_value()) << error;
    ASSERT_GE(bytes->size(), 8u);
    const uint8_t signature[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ((*bytes)[i], signature[i]);
    }
}

TEST(ImageIOTest, DecodePreservesAlpha) {
    PngCodec codec;
    std::vector<uint8_t> pixels = {
        255, 0, 0, 255,    0, 255, 0, 128,
        0, 0, 255, 0,      10, 20, 30, 40,
        1, 2, 3, 4,        5, 6, 7, 8
    };

    std::string error;
    auto bytes = codec.Encode(2, 3, pixels, &error);
    ASSERT_TRUE(bytes.has_value()) << error;

    auto image = codec.Decode(*bytes, &error);
    ASSERT_TRUE(image.has_value()) << error;
    EXPECT_EQ(image->width, 2);
    EXPECT_EQ(image->height, 3);
    EXPECT_EQ(image->pixels, pixels);
}

TEST(ImageIOTest, EncodeRejectsWrongPixelCount) {
    PngCodec codec;
    std::string error;
    auto bytes = codec.Encode(4, 4, std::vector<uint8_t>(10, 0), &error);
    EXPECT_FALSE(bytes.has_value());
    EXPECT_EQ(error, "Pixel data does not match image dimensions");
}

TEST(ImageIOTest, DecodeRejectsEmptyInput) {
    PngCodec codec;
    std::string error;
    EXPECT_FALSE(codec.Decode({}, &error).has_value());
    EXPECT_EQ(error, "Image file is empty");
}

TEST(ImageIOTest, DecodeRejectsGarbage) {
    PngCodec codec;
    std::string error;
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i'};
    EXPECT_FALSE(codec.Decode(garbage, &error).has_value());
    EXPECT_EQ(error.rfind("Failed to decode image", 0), 0u);
}

TEST(ImageIOTest, ExportAfterShrinkDecodesToTopLeftRegion) {
    EditorState state;
    PngCodec codec;
    EditorSession session(state, codec);
    session.Initialize();
    session.ResizeCanvas(32, 32);

    session.SetColor(Color(255, 128, 0, 200));
    session.PointerDown(2, 5);
    session.PointerUp();
    session.SetColor(Color(10, 20, 30));
    session.PointerDown(25, 25);
    session.PointerUp();
    std::vector<uint8_t> expected = session.GetBuffer().CopyRegion(16, 16);

    session.ResizeCanvas(16, 16);

    std::string error;
    auto bytes = session.ExportImage(&error);
    ASSERT_TRUE(bytes.has_value()) << error;

    auto image = codec.Decode(*bytes, &error);
    ASSERT_TRUE(image.has_value()) << error;
    EXPECT_EQ(image->width, 16);
    EXPECT_EQ(image->height, 16);
    EXPECT_EQ(image->pixels, expected);

    size_t painted = (5 * 16 + 2) * 4;
    EXPECT_EQ(image->pixels[painted + 0], 255);
    EXPECT_EQ(image->pixels[painted + 3], 200);
}
