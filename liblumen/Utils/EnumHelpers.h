#pragma once

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace lum
{
    // satisfied by enums that have a trailing `NUM_OPTIONS` member, which is
    // used to count the number of densely-packed options in the enum
    template<typename T>
    concept DenselyPackedOptionsEnum = std::is_enum_v<T> and requires { T::NUM_OPTIONS; };

    template<DenselyPackedOptionsEnum TEnum>
    constexpr size_t num_options()
    {
        return static_cast<size_t>(TEnum::NUM_OPTIONS);
    }

    template<DenselyPackedOptionsEnum TEnum>
    constexpr size_t to_index(TEnum v)
    {
        return static_cast<size_t>(v);
    }
}
