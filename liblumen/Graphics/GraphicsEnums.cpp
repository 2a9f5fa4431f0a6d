#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <ostream>
#include <string_view>

using namespace lum;

namespace
{
    constexpr auto c_bind_mode_strings = std::to_array<std::string_view>({
        "Cached",
        "Forced",
    });
    static_assert(c_bind_mode_strings.size() == num_options<BindMode>());

    constexpr auto c_buffer_target_strings = std::to_array<std::string_view>({
        "Array",
        "ElementArray",
    });
    static_assert(c_buffer_target_strings.size() == num_options<BufferTarget>());

    constexpr auto c_buffer_usage_strings = std::to_array<std::string_view>({
        "StreamDraw",
        "StaticDraw",
        "DynamicDraw",
    });
    static_assert(c_buffer_usage_strings.size() == num_options<BufferUsage>());

    constexpr auto c_buffer_map_access_strings = std::to_array<std::string_view>({
        "Read",
        "Write",
        "ReadWrite",
    });
    static_assert(c_buffer_map_access_strings.size() == num_options<BufferMapAccess>());
}

std::ostream& lum::operator<<(std::ostream& o, BindMode mode)
{
    return o << c_bind_mode_strings.at(to_index(mode));
}

std::ostream& lum::operator<<(std::ostream& o, BufferTarget target)
{
    return o << c_buffer_target_strings.at(to_index(target));
}

std::ostream& lum::operator<<(std::ostream& o, BufferUsage usage)
{
    return o << c_buffer_usage_strings.at(to_index(usage));
}

std::ostream& lum::operator<<(std::ostream& o, BufferMapAccess access)
{
    return o << c_buffer_map_access_strings.at(to_index(access));
}
