// ANCHORZK - Field Split Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/anchor/field_split.h"

namespace anchorzk {
namespace test {

using anchor::ReconstructCoordinate;
using anchor::SplitCoordinate;
using anchor::SplitPointX;
using bn254::BaseFieldElement;
using bn254::Point;

TEST(FieldSplitTest, SmallValueHasZeroHighLimb) {
    auto split = SplitCoordinate(BaseFieldElement::FromUint64(5));
    EXPECT_EQ(split[0], FieldElement(5));
    EXPECT_TRUE(split[1].IsZero());
}

TEST(FieldSplitTest, LimbsAreLittleEndianHalves) {
    // x = 2^128 + 7
    std::array<uint8_t, 32> be{};
    be[15] = 0x01;
    be[31] = 0x07;
    auto split = SplitCoordinate(BaseFieldElement(be));
    EXPECT_EQ(split[0], FieldElement(7));
    EXPECT_EQ(split[1], FieldElement(1));
}

TEST(FieldSplitTest, ReconstructRoundTrip) {
    Point p = Point::Generator() * Scalar(12345);
    auto x = p.AffineX();
    ASSERT_TRUE(x.has_value());
    auto split = SplitCoordinate(*x);
    auto back = ReconstructCoordinate(split[0], split[1]);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, *x);
}

TEST(FieldSplitTest, ReconstructRejectsWideLimb) {
    FieldElement wide = FieldElement::FromHex("0x100000000000000000000000000000000");
    EXPECT_FALSE(ReconstructCoordinate(wide, FieldElement(0)).has_value());
    EXPECT_FALSE(ReconstructCoordinate(FieldElement(0), wide).has_value());
}

TEST(FieldSplitTest, ReconstructRejectsBaseModulus) {
    // q split into 128-bit halves
    FieldElement low = FieldElement::FromHex("0x97816a916871ca8d3c208c16d87cfd47");
    FieldElement high = FieldElement::FromHex("0x30644e72e131a029b85045b68181585d");
    EXPECT_FALSE(ReconstructCoordinate(low, high).has_value());

    FieldElement below = FieldElement::FromHex("0x97816a916871ca8d3c208c16d87cfd46");
    EXPECT_TRUE(ReconstructCoordinate(below, high).has_value());
}

TEST(FieldSplitTest, IdentityHasNoSplit) {
    EXPECT_FALSE(SplitPointX(Point::Identity()).has_value());
    auto g = SplitPointX(Point::Generator());
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ((*g)[0], FieldElement(1));
    EXPECT_TRUE((*g)[1].IsZero());
}

} // namespace test
} // namespace anchorzk
