#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <ostream>

namespace lum
{
    // a strongly-typed, non-owning, backend-allocated object name
    //
    // the zero value is reserved as the "none" handle (i.e. the equivalent of
    // binding `0` in OpenGL)
    template<typename Tag>
    class NativeHandle final {
    public:
        using value_type = uint32_t;

        constexpr NativeHandle() = default;
        explicit constexpr NativeHandle(value_type value) : value_{value} {}

        constexpr value_type get() const { return value_; }
        explicit constexpr operator bool () const { return value_ != 0; }

        friend constexpr bool operator==(const NativeHandle&, const NativeHandle&) = default;

        friend std::ostream& operator<<(std::ostream& o, const NativeHandle& handle)
        {
            return o << Tag::name << '(' << handle.value_ << ')';
        }
    private:
        value_type value_ = 0;
    };

    struct BufferHandleTag final { static constexpr const char* name = "BufferHandle"; };
    using BufferHandle = NativeHandle<BufferHandleTag>;

    struct VertexArrayHandleTag final { static constexpr const char* name = "VertexArrayHandle"; };
    using VertexArrayHandle = NativeHandle<VertexArrayHandleTag>;
}

template<typename Tag>
struct std::hash<lum::NativeHandle<Tag>> final {
    size_t operator()(const lum::NativeHandle<Tag>& handle) const noexcept
    {
        return std::hash<typename lum::NativeHandle<Tag>::value_type>{}(handle.get());
    }
};
