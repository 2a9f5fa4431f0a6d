#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <limits>

namespace lum
{
    // the integer width of the indices in an index buffer
    enum class TessIndexType {
        U8,
        U16,
        U32,
        NUM_OPTIONS,
    };

    size_t size_of(TessIndexType);

    // returns the value reserved as the primitive-restart sentinel when using
    // fixed-index primitive restart (i.e. the maximum value of the index type)
    uint32_t primitive_restart_sentinel_of(TessIndexType);

    std::ostream& operator<<(std::ostream&, TessIndexType);

    template<typename T>
    struct TessIndexTraits;

    template<>
    struct TessIndexTraits<uint8_t> final {
        static constexpr TessIndexType index_type = TessIndexType::U8;
        static constexpr uint8_t primitive_restart_sentinel = std::numeric_limits<uint8_t>::max();
    };

    template<>
    struct TessIndexTraits<uint16_t> final {
        static constexpr TessIndexType index_type = TessIndexType::U16;
        static constexpr uint16_t primitive_restart_sentinel = std::numeric_limits<uint16_t>::max();
    };

    template<>
    struct TessIndexTraits<uint32_t> final {
        static constexpr TessIndexType index_type = TessIndexType::U32;
        static constexpr uint32_t primitive_restart_sentinel = std::numeric_limits<uint32_t>::max();
    };

    // satisfied by types that can be used as indices in a tessellation's index buffer
    template<typename T>
    concept TessIndex = std::unsigned_integral<T> and requires {
        { TessIndexTraits<T>::index_type } -> std::convertible_to<TessIndexType>;
        { TessIndexTraits<T>::primitive_restart_sentinel } -> std::convertible_to<T>;
    };
}
