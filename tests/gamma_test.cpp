#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "gamma.h"

TEST(gamma, identity_at_one_is_exact)
{
    for (int i = 0; i <= 2550; ++i) {
        const double x = i * 0.1;
        const Vector4d px(x, 255.0 - x, x * 0.5, 1.0 / 3.0);
        const Vector4d round_trip = gamma_decode_pixel(gamma_encode_pixel(px, 1.0), 1.0);
        EXPECT_EQ(round_trip, px);
    }
}

TEST(gamma, round_trip)
{
    const double gammas[] = {0.5, 2.2, 3.0, 5.0};
    for (double g : gammas) {
        for (int i = 0; i <= 255; ++i) {
            const Vector4d px = Vector4d::Constant((double)i);
            const Vector4d round_trip = gamma_decode_pixel(gamma_encode_pixel(px, g), g);
            EXPECT_NEAR(round_trip[0], (double)i, 1e-9) << "gamma " << g;
        }
    }
}

TEST(gamma, encode_values)
{
    const Vector4d enc = gamma_encode_pixel(Vector4d(2.0, 3.0, 0.0, 255.0), 3.0);
    EXPECT_DOUBLE_EQ(enc[0], 8.0);
    EXPECT_DOUBLE_EQ(enc[1], 27.0);
    EXPECT_DOUBLE_EQ(enc[2], 0.0);
    EXPECT_DOUBLE_EQ(enc[3], 16581375.0);
}

TEST(gamma, decode_clamps_to_channel_range)
{
    const Vector4d dec = gamma_decode_pixel(Vector4d(-5.0, 300.0 * 300.0, 1e12, 64.0), 2.0);
    EXPECT_EQ(dec[0], 0.0);
    EXPECT_EQ(dec[1], 255.0);
    EXPECT_EQ(dec[2], 255.0);
    EXPECT_DOUBLE_EQ(dec[3], 8.0);

    const Vector4d linear = gamma_decode_pixel(Vector4d(-0.25, 256.0, 12.5, 0.0), 1.0);
    EXPECT_EQ(linear, Vector4d(0.0, 255.0, 12.5, 0.0));
}

TEST(gamma, encode_image)
{
    const Vector4d pixels[2] = {Vector4d(1.0, 2.0, 3.0, 4.0), Vector4d(0.0, 10.0, 5.0, 1.0)};
    complex_image_s out;
    ASSERT_EQ(gamma_encode(pixels, 2, 1, 2.0, out), BK_OK);
    ASSERT_EQ(out.width, 2);
    ASSERT_EQ(out.height, 1);
    EXPECT_EQ(out.pixels[0][3], complex_t(16.0, 0.0));
    EXPECT_EQ(out.pixels[1][1], complex_t(100.0, 0.0));
}

TEST(gamma, invalid_gamma_is_numeric_error)
{
    const Vector4d pixels[1] = {Vector4d::Constant(10.0)};
    complex_image_s out;
    EXPECT_EQ(gamma_encode(pixels, 1, 1, 0.0, out), BK_ERR_NUMERIC);
    EXPECT_EQ(gamma_encode(pixels, 1, 1, -2.0, out), BK_ERR_NUMERIC);
    EXPECT_EQ(gamma_encode(pixels, 1, 1, std::numeric_limits<double>::quiet_NaN(), out),
              BK_ERR_NUMERIC);
    EXPECT_EQ(gamma_encode(pixels, 1, 1, std::numeric_limits<double>::infinity(), out),
              BK_ERR_NUMERIC);
}

TEST(gamma, non_finite_encoding_is_numeric_error)
{
    const Vector4d negative[1] = {Vector4d(-1.0, 0.0, 0.0, 0.0)};
    complex_image_s out;
    EXPECT_EQ(gamma_encode(negative, 1, 1, 2.5, out), BK_ERR_NUMERIC);

    const Vector4d huge[1] = {Vector4d(1e300, 0.0, 0.0, 0.0)};
    EXPECT_EQ(gamma_encode(huge, 1, 1, 3.0, out), BK_ERR_NUMERIC);
}
