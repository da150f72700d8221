#include "io/image_loader.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace gridfill;

TEST(ImageLoader, ProbesPngDimensions)
{
    image_loader::ImageInfo info;
    std::string err;
    ASSERT_TRUE(image_loader::ProbeImage(test::TinyPng(), info, err)) << err;
    EXPECT_EQ(info.format, "PNG");
    EXPECT_EQ(info.width, 1);
    EXPECT_EQ(info.height, 1);
}

TEST(ImageLoader, RejectsUnknownAndTruncatedData)
{
    image_loader::ImageInfo info;
    std::string err;
    EXPECT_FALSE(image_loader::ProbeImage({}, info, err));
    EXPECT_FALSE(image_loader::ProbeImage({'h', 'e', 'l', 'l', 'o'}, info, err));
    EXPECT_EQ(err, "Unrecognized image signature.");

    std::vector<std::uint8_t> truncated = test::TinyPng();
    truncated.resize(12);
    EXPECT_FALSE(image_loader::ProbeImage(truncated, info, err));
    EXPECT_EQ(info.width, 0);
}

TEST(ImageLoader, TypeNamesAreCanonical)
{
    EXPECT_EQ(image_loader::CanonicalImageType("jpg"), "JPEG");
    EXPECT_EQ(image_loader::CanonicalImageType("Png"), "PNG");
    EXPECT_TRUE(image_loader::ImageTypeMatches("JPG", "JPEG"));
    EXPECT_TRUE(image_loader::ImageTypeMatches("png", "PNG"));
    EXPECT_FALSE(image_loader::ImageTypeMatches("GIF", "PNG"));
}
