#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "gaussian.h"

TEST(gaussian, kernel_values)
{
    const std::vector<double> k = gaussian_kernel(1.0, 4);
    const double expected[9] = {0.00013383062461474178, 0.004431861620031266,
                                0.053991127420704416, 0.24197144565660075,
                                0.39894346935609776, 0.24197144565660075,
                                0.053991127420704416, 0.004431861620031266,
                                0.00013383062461474178};
    ASSERT_EQ(k.size(), 9u);
    for (int i = 0; i < 9; ++i)
        EXPECT_NEAR(k[i], expected[i], 1e-15);
}

TEST(gaussian, kernel_sums_to_one)
{
    for (double sigma : {0.5, 1.0, 2.5, 10.0}) {
        const std::vector<double> k = gaussian_kernel(sigma, 6);
        EXPECT_NEAR(std::accumulate(k.begin(), k.end(), 0.0), 1.0, 1e-12);
    }
}

TEST(gaussian, flat_image_interior_unchanged)
{
    const int w = 10, h = 8, radius = 3;
    std::vector<Vector4d> img((size_t)w * h, Vector4d::Constant(80.0));
    ASSERT_EQ(gaussian_blur(img.data(), img.size(), w, h, 1.5, radius), BK_OK);

    for (int y = radius; y < h - radius; ++y) {
        for (int x = radius; x < w - radius; ++x)
            EXPECT_NEAR(img[y * w + x][0], 80.0, 1e-9);
    }

    /* Dropped taps darken the borders. */
    EXPECT_LT(img[0][0], img[0 * w + 4][0]);
    EXPECT_LT(img[0 * w + 4][0], 80.0);
}

TEST(gaussian, impulse_spreads_symmetrically)
{
    rgba_image_s img;
    img.width = 7;
    img.height = 7;
    img.pixels.assign(49, Vector4d::Zero());
    img.at(3, 3) = Vector4d::Constant(100.0);

    ASSERT_EQ(gaussian_blur(img, 1.0, 2), BK_OK);

    EXPECT_DOUBLE_EQ(img.at(2, 3)[0], img.at(4, 3)[0]);
    EXPECT_DOUBLE_EQ(img.at(3, 2)[0], img.at(3, 4)[0]);
    EXPECT_NEAR(img.at(2, 3)[0], img.at(3, 2)[0], 1e-12);
    EXPECT_GT(img.at(3, 3)[0], img.at(2, 3)[0]);

    double total = 0.0;
    for (const Vector4d &p : img.pixels)
        total += p[0];
    EXPECT_NEAR(total, 100.0, 1e-9);
}

TEST(gaussian, errors)
{
    std::vector<Vector4d> img(25, Vector4d::Constant(1.0));
    EXPECT_EQ(gaussian_blur(img.data(), img.size(), 5, 5, 0.0, 1), BK_ERR_CONFIG);
    EXPECT_EQ(gaussian_blur(img.data(), img.size(), 5, 5, 1.0, 0), BK_ERR_CONFIG);
    EXPECT_EQ(gaussian_blur(img.data(), img.size(), 5, 5, 1.0, 3), BK_ERR_DIMENSION);
    EXPECT_EQ(gaussian_blur(img.data(), img.size(), 5, 4, 1.0, 1), BK_ERR_DIMENSION);
}
