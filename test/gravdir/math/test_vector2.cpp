#include "../common/common.hpp"
#include <limits>

TEST(vector2_test, arithmetic) {
    auto a = gravdir::vector2{3, -4};
    auto b = gravdir::vector2{0.5, 2};

    ASSERT_VECTOR2_EQ(a + b, {3.5, -2});
    ASSERT_VECTOR2_EQ(a - b, {2.5, -6});
    ASSERT_VECTOR2_EQ(-a, {-3, 4});
    ASSERT_VECTOR2_EQ(a * 2, {6, -8});
    ASSERT_VECTOR2_EQ(2 * a, {6, -8});
    ASSERT_VECTOR2_EQ(a / 2, {1.5, -2});

    a += b;
    ASSERT_VECTOR2_EQ(a, {3.5, -2});
    a -= b;
    ASSERT_VECTOR2_EQ(a, {3, -4});
    a *= 0.5;
    ASSERT_VECTOR2_EQ(a, {1.5, -2});
}

TEST(vector2_test, length) {
    auto v = gravdir::vector2{3, -4};
    ASSERT_SCALAR_EQ(gravdir::dot(v, gravdir::vector2_x), 3);
    ASSERT_SCALAR_EQ(gravdir::length_sqr(v), 25);
    ASSERT_SCALAR_EQ(gravdir::length(v), 5);
    ASSERT_VECTOR2_EQ(gravdir::normalize(v), {0.6, -0.8});
}

TEST(vector2_test, comparison) {
    auto v = gravdir::vector2{1, 2};
    ASSERT_TRUE(v == v);
    ASSERT_TRUE(v != gravdir::vector2_one);
    ASSERT_SCALAR_EQ(v[0], 1);
    ASSERT_SCALAR_EQ(v[1], 2);
}

TEST(vector2_test, finite) {
    ASSERT_TRUE(gravdir::is_finite(gravdir::vector2_one));
    auto v = gravdir::vector2{-std::numeric_limits<gravdir::scalar>::infinity(), 0};
    ASSERT_FALSE(gravdir::is_finite(v));
}

TEST(vector2_test, vector3_conversion) {
    auto v = gravdir::to_vector3_xy(gravdir::vector2{1, 2});
    ASSERT_EQ(v, (gravdir::vector3{1, 2, 0}));
    ASSERT_EQ(gravdir::to_vector2_xy(gravdir::vector3{4, 5, 6}), (gravdir::vector2{4, 5}));
}
