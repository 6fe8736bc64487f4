#include "../common/common.hpp"
#include <limits>
#include <random>

class vector3_test: public ::testing::Test {
protected:
    std::random_device rd;
    std::mt19937 gen;
    std::uniform_real_distribution<gravdir::scalar> dist;

    vector3_test() :
        gen(rd()),
        dist(-1e4, 1e4)
    {}

public:
    gravdir::scalar random() {
        return dist(gen);
    }
    gravdir::vector3 randomvec() {
        return {random(), random(), random()};
    }
};

TEST_F(vector3_test, arithmetic) {
    auto a = randomvec();
    auto b = randomvec();

    ASSERT_VECTOR3_EQ(a + b, {a.x + b.x, a.y + b.y, a.z + b.z});
    ASSERT_VECTOR3_EQ(a - b, {a.x - b.x, a.y - b.y, a.z - b.z});
    ASSERT_VECTOR3_EQ(-b, {-b.x, -b.y, -b.z});

    auto s = gravdir::scalar(1.618);
    ASSERT_VECTOR3_EQ(a * s, {a.x * s, a.y * s, a.z * s});
    ASSERT_VECTOR3_EQ(s * b, {s * b.x, s * b.y, s * b.z});
    ASSERT_VECTOR3_EQ(a / s, {a.x / s, a.y / s, a.z / s});

    gravdir::vector3 c {a.x + b.x, a.y + b.y, a.z + b.z};
    a += b;
    ASSERT_VECTOR3_EQ(a, c);

    gravdir::vector3 d {b.x - a.x, b.y - a.y, b.z - a.z};
    b -= a;
    ASSERT_VECTOR3_EQ(b, d);

    gravdir::vector3 e {c.x * s, c.y * s, c.z * s};
    c *= s;
    ASSERT_VECTOR3_EQ(c, e);
}

TEST_F(vector3_test, subscript) {
    auto v = randomvec();
    ASSERT_EQ(v[0], v.x);
    ASSERT_EQ(v[1], v.y);
    ASSERT_EQ(v[2], v.z);

    v[2] = 7;
    ASSERT_SCALAR_EQ(v.z, 7);
}

TEST_F(vector3_test, cross) {
    constexpr auto vx = gravdir::vector3_x;
    constexpr auto vy = gravdir::vector3_y;
    constexpr auto vz = gravdir::vector3_z;

    ASSERT_EQ(gravdir::cross(vx, vx), gravdir::vector3_zero);
    ASSERT_EQ(gravdir::cross(vx, vy), vz);
    ASSERT_EQ(gravdir::cross(vz, vx), vy);
    ASSERT_EQ(gravdir::cross(vy, vz), vx);
}

TEST_F(vector3_test, length) {
    auto v = randomvec();
    ASSERT_SCALAR_EQ(gravdir::length_sqr(v), v.x * v.x + v.y * v.y + v.z * v.z);
    ASSERT_SCALAR_EQ(gravdir::length(v), std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z));
    ASSERT_SCALAR_EQ(gravdir::dot(v, gravdir::vector3_y), v.y);
}

TEST_F(vector3_test, normalize) {
    auto v = randomvec();

    if (gravdir::length_sqr(v) < GRAVDIR_EPSILON) {
        v = gravdir::vector3_x;
    }

    auto nv = gravdir::normalize(v);
    ASSERT_NEAR(gravdir::length(nv), 1, 1e-5);
}

TEST_F(vector3_test, comparison) {
    auto v = gravdir::vector3{1, 2, 3};
    auto w = gravdir::vector3{1, 2, 4};
    ASSERT_TRUE(v == v);
    ASSERT_FALSE(v == w);
    ASSERT_FALSE(v != v);
    ASSERT_TRUE(v != w);
}

TEST_F(vector3_test, finite) {
    ASSERT_TRUE(gravdir::is_finite(randomvec()));

    auto v = gravdir::vector3_zero;
    v.z = std::numeric_limits<gravdir::scalar>::infinity();
    ASSERT_FALSE(gravdir::is_finite(v));

    v.z = std::numeric_limits<gravdir::scalar>::quiet_NaN();
    ASSERT_FALSE(gravdir::is_finite(v));
    ASSERT_FALSE(v == v);
}
