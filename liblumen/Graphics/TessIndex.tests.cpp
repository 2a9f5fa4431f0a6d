#include "TessIndex.h"

#include <liblumen/Graphics/TessMode.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>

using namespace lum;

static_assert(TessIndex<uint8_t>);
static_assert(TessIndex<uint16_t>);
static_assert(TessIndex<uint32_t>);
static_assert(not TessIndex<int32_t>);
static_assert(not TessIndex<uint64_t>);

TEST(TessIndexType, primitive_restart_sentinel_is_the_maximum_value_of_the_type)
{
    ASSERT_EQ(primitive_restart_sentinel_of(TessIndexType::U8), 0xff);
    ASSERT_EQ(primitive_restart_sentinel_of(TessIndexType::U16), 0xffff);
    ASSERT_EQ(primitive_restart_sentinel_of(TessIndexType::U32), 0xffffffff);
}

TEST(TessIndexType, size_of_returns_the_width_of_the_type)
{
    ASSERT_EQ(size_of(TessIndexType::U8), 1);
    ASSERT_EQ(size_of(TessIndexType::U16), 2);
    ASSERT_EQ(size_of(TessIndexType::U32), 4);
}

TEST(TessMode, defaults_to_triangles)
{
    ASSERT_EQ(TessMode{}.primitive(), TessPrimitive::Triangle);
    ASSERT_FALSE(TessMode{}.is_patch());
}

TEST(TessMode, patch_carries_its_number_of_vertices)
{
    constexpr TessMode mode = TessMode::patch(4);
    static_assert(mode.is_patch());
    ASSERT_EQ(mode.vertices_per_patch(), 4);
    ASSERT_NE(mode, TessMode::patch(3));
}

TEST(TessMode, can_be_written_to_a_stream)
{
    std::stringstream ss;
    ss << TessMode{TessPrimitive::LineStrip};
    ASSERT_FALSE(ss.str().empty());
}
