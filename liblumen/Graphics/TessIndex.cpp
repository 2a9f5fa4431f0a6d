#include "TessIndex.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

using namespace lum;

namespace
{
    struct IndexTypeTraits final {
        std::string_view name;
        size_t size;
        uint32_t primitive_restart_sentinel;
    };

    constexpr auto c_index_type_traits = std::to_array<IndexTypeTraits>({
        {"U8",  sizeof(uint8_t),  TessIndexTraits<uint8_t>::primitive_restart_sentinel},
        {"U16", sizeof(uint16_t), TessIndexTraits<uint16_t>::primitive_restart_sentinel},
        {"U32", sizeof(uint32_t), TessIndexTraits<uint32_t>::primitive_restart_sentinel},
    });
    static_assert(c_index_type_traits.size() == num_options<TessIndexType>());
}

size_t lum::size_of(TessIndexType type)
{
    return c_index_type_traits.at(to_index(type)).size;
}

uint32_t lum::primitive_restart_sentinel_of(TessIndexType type)
{
    return c_index_type_traits.at(to_index(type)).primitive_restart_sentinel;
}

std::ostream& lum::operator<<(std::ostream& o, TessIndexType type)
{
    return o << c_index_type_traits.at(to_index(type)).name;
}
