#include "recognition/descriptor.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>


TEST(DescriptorTest, SerializeDeserializeIsExact) {
    Descriptor original(DEFAULT_DESCRIPTOR_DIM);
    for (size_t i = 0; i < original.size(); ++i) {
        original[i] = std::sin(static_cast<double>(i) * 0.37) / 3.0 - 1e-9 * i;
    }

    auto blob = serialize_descriptor(original);
    ASSERT_EQ(blob.size(), original.size() * 8);

    Descriptor decoded;
    ASSERT_TRUE(deserialize_descriptor(blob.data(), blob.size(), DEFAULT_DESCRIPTOR_DIM, decoded));
    EXPECT_EQ(decoded, original);
}

TEST(DescriptorTest, BlobIsLittleEndianWithoutHeader) {
    Descriptor one{1.0};
    auto blob = serialize_descriptor(one);

    // 1.0 = 0x3FF0000000000000
    ASSERT_EQ(blob.size(), 8u);
    EXPECT_EQ(blob[0], 0x00);
    EXPECT_EQ(blob[6], 0xF0);
    EXPECT_EQ(blob[7], 0x3F);
}

TEST(DescriptorTest, WrongLengthFails) {
    auto blob = serialize_descriptor(test_support::make_descriptor(0.1));
    Descriptor out{42.0};

    EXPECT_FALSE(deserialize_descriptor(blob.data(), blob.size() - 1, DEFAULT_DESCRIPTOR_DIM, out));
    EXPECT_FALSE(deserialize_descriptor(blob.data(), blob.size(), 64, out));
    EXPECT_FALSE(deserialize_descriptor(blob.data(), 0, DEFAULT_DESCRIPTOR_DIM, out));
    EXPECT_EQ(out, Descriptor{42.0});
}

TEST(DescriptorTest, ValidityChecksDimensionAndFiniteness) {
    EXPECT_TRUE(is_valid_descriptor(test_support::make_descriptor(0.2), DEFAULT_DESCRIPTOR_DIM));
    EXPECT_FALSE(is_valid_descriptor(test_support::make_descriptor(0.2, 0.0, 64), DEFAULT_DESCRIPTOR_DIM));

    auto nan = test_support::make_descriptor(0.2);
    nan[5] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(is_valid_descriptor(nan, DEFAULT_DESCRIPTOR_DIM));
}

TEST(DescriptorTest, EuclideanDistance) {
    Descriptor a{0.0, 0.0};
    Descriptor b{3.0, 4.0};
    EXPECT_DOUBLE_EQ(euclidean_distance(a, b), 5.0);
    EXPECT_DOUBLE_EQ(euclidean_distance(b, b), 0.0);
    EXPECT_TRUE(std::isinf(euclidean_distance(a, Descriptor{1.0})));
}
