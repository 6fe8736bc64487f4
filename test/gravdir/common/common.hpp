#ifndef TEST_GRAVDIR_COMMON_COMMON_HPP
#define TEST_GRAVDIR_COMMON_COMMON_HPP

#include <gtest/gtest.h>
#include <gravdir/gravdir.hpp>

#ifdef GRAVDIR_DOUBLE_PRECISION
#define ASSERT_SCALAR_EQ ASSERT_DOUBLE_EQ
#else
#define ASSERT_SCALAR_EQ ASSERT_FLOAT_EQ
#endif

inline void ASSERT_VECTOR2_EQ(gravdir::vector2 v0, gravdir::vector2 v1) {
    ASSERT_SCALAR_EQ(v0.x, v1.x);
    ASSERT_SCALAR_EQ(v0.y, v1.y);
}

inline void ASSERT_VECTOR3_EQ(gravdir::vector3 v0, gravdir::vector3 v1) {
    ASSERT_SCALAR_EQ(v0.x, v1.x);
    ASSERT_SCALAR_EQ(v0.y, v1.y);
    ASSERT_SCALAR_EQ(v0.z, v1.z);
}

#endif // TEST_GRAVDIR_COMMON_COMMON_HPP
