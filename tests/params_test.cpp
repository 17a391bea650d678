#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <string>

#include "params.h"

namespace {

std::string write_temp_file(const char *name, const char *contents)
{
    const std::string path = testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

}  // namespace

TEST(params, presets_have_matching_component_counts)
{
    for (int n = BK_MIN_PRESET; n <= BK_MAX_PRESET; ++n) {
        const kernel_params_s *p = kernel_params_preset(n);
        ASSERT_NE(p, nullptr);
        EXPECT_EQ(p->num_components(), n);
        EXPECT_EQ(validate_kernel_params(*p), BK_OK);
    }
}

TEST(params, preset_out_of_range)
{
    EXPECT_EQ(kernel_params_preset(0), nullptr);
    EXPECT_EQ(kernel_params_preset(10), nullptr);
    EXPECT_EQ(kernel_params_preset(-3), nullptr);
}

TEST(params, preset_values)
{
    const kernel_params_s *k1 = kernel_params_preset(1);
    EXPECT_DOUBLE_EQ(k1->a(0), 0.862325);
    EXPECT_DOUBLE_EQ(k1->b(0), 1.624835);
    EXPECT_DOUBLE_EQ(k1->real_weight(0), 0.767583);
    EXPECT_DOUBLE_EQ(k1->imag_weight(0), 1.862321);

    const kernel_params_s *k9 = kernel_params_preset(9);
    EXPECT_DOUBLE_EQ(k9->a(0), 7.393797857697906);
    EXPECT_DOUBLE_EQ(k9->real_weight(1), 3005.0995149934884);
    EXPECT_DOUBLE_EQ(k9->imag_weight(8), -0.8591239990799346);
}

TEST(params, validate_rejects_empty_and_non_finite)
{
    kernel_params_s empty;
    EXPECT_EQ(validate_kernel_params(empty), BK_ERR_CONFIG);

    kernel_params_s bad;
    bad.components.push_back({1.0, 1.0, std::numeric_limits<double>::quiet_NaN(), 0.0});
    EXPECT_EQ(validate_kernel_params(bad), BK_ERR_CONFIG);

    bad.components[0].real_weight = 1.0;
    bad.components[0].b = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_kernel_params(bad), BK_ERR_CONFIG);
}

TEST(params, load_custom_table)
{
    const std::string path = write_temp_file("bk_table.txt",
                                              "# two component family\n"
                                              "name: my family\n"
                                              "\n"
                                              "  0.886528 5.268909 0.411259 -0.548794\n"
                                              "  1.960518 1.558213 0.513282 4.561110  # second\n");
    kernel_params_s p;
    ASSERT_TRUE(load_kernel_params(path.c_str(), p));
    EXPECT_EQ(p.name, "my family");
    ASSERT_EQ(p.num_components(), 2);
    EXPECT_DOUBLE_EQ(p.a(1), 1.960518);
    EXPECT_DOUBLE_EQ(p.imag_weight(1), 4.561110);

    const kernel_params_s *k2 = kernel_params_preset(2);
    for (int i = 0; i < 2; ++i) {
        EXPECT_DOUBLE_EQ(p.a(i), k2->a(i));
        EXPECT_DOUBLE_EQ(p.b(i), k2->b(i));
        EXPECT_DOUBLE_EQ(p.real_weight(i), k2->real_weight(i));
        EXPECT_DOUBLE_EQ(p.imag_weight(i), k2->imag_weight(i));
    }
}

TEST(params, load_rejects_bad_files)
{
    kernel_params_s p;
    EXPECT_FALSE(load_kernel_params("/nonexistent/bk_table.txt", p));

    const std::string short_line = write_temp_file("bk_short.txt", "1.0 2.0 3.0\n");
    EXPECT_FALSE(load_kernel_params(short_line.c_str(), p));

    const std::string extra = write_temp_file("bk_extra.txt", "1.0 2.0 3.0 4.0 5.0\n");
    EXPECT_FALSE(load_kernel_params(extra.c_str(), p));

    const std::string empty = write_temp_file("bk_empty.txt", "# nothing\nname: x\n");
    EXPECT_FALSE(load_kernel_params(empty.c_str(), p));
}
