#include <gtest/gtest.h>

#include "mask.h"

TEST(mask, selects_per_pixel)
{
    const Vector4d original[3] = {Vector4d::Constant(1.0), Vector4d::Constant(2.0),
                                  Vector4d::Constant(3.0)};
    const Vector4d convolved[3] = {Vector4d::Constant(10.0), Vector4d::Constant(20.0),
                                   Vector4d::Constant(30.0)};
    Vector4d out[3];

    ASSERT_EQ(composite_masked(original, convolved, {true, false, true}, 3, out), BK_OK);
    EXPECT_EQ(out[0], convolved[0]);
    EXPECT_EQ(out[1], original[1]);
    EXPECT_EQ(out[2], convolved[2]);
}

TEST(mask, in_place)
{
    Vector4d pixels[2] = {Vector4d::Constant(1.0), Vector4d::Constant(2.0)};
    const Vector4d convolved[2] = {Vector4d::Constant(5.0), Vector4d::Constant(6.0)};

    ASSERT_EQ(composite_masked(pixels, convolved, {false, true}, 2, pixels), BK_OK);
    EXPECT_EQ(pixels[0], Vector4d::Constant(1.0));
    EXPECT_EQ(pixels[1], Vector4d::Constant(6.0));
}

TEST(mask, length_mismatch_writes_nothing)
{
    const Vector4d original[2] = {Vector4d::Constant(1.0), Vector4d::Constant(2.0)};
    const Vector4d convolved[2] = {Vector4d::Constant(5.0), Vector4d::Constant(6.0)};
    Vector4d out[2] = {Vector4d::Constant(-1.0), Vector4d::Constant(-1.0)};

    EXPECT_EQ(composite_masked(original, convolved, {true}, 2, out), BK_ERR_DIMENSION);
    EXPECT_EQ(composite_masked(original, convolved, {true, true, true}, 2, out), BK_ERR_DIMENSION);
    EXPECT_EQ(out[0], Vector4d::Constant(-1.0));
    EXPECT_EQ(out[1], Vector4d::Constant(-1.0));
}
