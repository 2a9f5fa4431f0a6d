#pragma once

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferMapping.h>
#include <liblumen/Graphics/BufferSlice.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Utils/Assertions.h>

#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace lum
{
    // a typed, GPU-resident, fixed-length array of `T`
    //
    // created via a `GraphicsContext` (e.g. `GraphicsContext::new_buffer`). All
    // element access goes through a scoped mapping, so it is synchronous: it
    // may block until prior GPU writes to the buffer complete.
    template<typename T>
    requires std::is_trivially_copyable_v<T>
    class Buffer final {
    public:
        using value_type = T;

        explicit Buffer(RawBuffer raw) :
            raw_{std::move(raw)}
        {
            LUM_ASSERT_ALWAYS(raw_.element_size() == sizeof(T) && "the raw buffer's element size does not match the buffer's element type");
        }

        // returns the number of elements in the buffer
        size_t len() const { return raw_.len(); }
        size_t bytes() const { return raw_.bytes(); }
        bool empty() const { return len() == 0; }
        BufferHandle handle() const { return raw_.handle(); }
        BufferTarget target() const { return raw_.target(); }

        // returns the element at index `i`, or `std::nullopt` if `i >= len()`
        std::optional<T> at(size_t i) const
        {
            if (i >= len()) {
                return std::nullopt;
            }

            const BufferMapping mapping{raw_, i * sizeof(T), sizeof(T), BufferMapAccess::Read};
            std::array<std::byte, sizeof(T)> bytes{};
            std::memcpy(bytes.data(), mapping.data(), sizeof(T));
            return std::bit_cast<T>(bytes);
        }

        // returns a copy of every element in the buffer
        std::vector<T> whole() const
        {
            const BufferSlice<T> elements = slice();
            return std::vector<T>(elements.begin(), elements.end());
        }

        // sets the element at index `i` to `value`
        //
        // throws `BufferError` (`Overflow`) if `i >= len()`
        void set(size_t i, const T& value)
        {
            if (i >= len()) {
                throw BufferError::overflow(i, len());
            }

            const BufferMapping mapping{raw_, i * sizeof(T), sizeof(T), BufferMapAccess::Write};
            std::memcpy(mapping.data(), &value, sizeof(T));
        }

        // overwrites every element of the buffer with `values`
        //
        // `values` must contain exactly `len()` elements, otherwise `BufferError`
        // (`TooFewValues` or `TooManyValues`) is thrown and the buffer is left untouched
        void write_whole(std::span<const T> values)
        {
            if (values.size() < len()) {
                throw BufferError::too_few_values(values.size(), len());
            }
            if (values.size() > len()) {
                throw BufferError::too_many_values(values.size(), len());
            }

            const BufferMapping mapping{raw_, 0, bytes(), BufferMapAccess::Write};
            if (not values.empty()) {
                std::memcpy(mapping.data(), values.data(), values.size_bytes());
            }
        }

        // sets every element of the buffer to `value`
        void clear(const T& value)
        {
            const BufferMapping mapping{raw_, 0, bytes(), BufferMapAccess::Write};
            for (size_t i = 0; i < len(); ++i) {
                std::memcpy(mapping.data() + (i * sizeof(T)), &value, sizeof(T));
            }
        }

        // returns a scoped, read-only, mapping of the whole buffer
        BufferSlice<T> slice() const { return BufferSlice<T>{raw_}; }

        // returns a scoped, read-write, mapping of the whole buffer
        BufferSliceMut<T> slice_mut() { return BufferSliceMut<T>{raw_}; }

        const RawBuffer& raw() const { return raw_; }

        // releases ownership of the underlying (untyped) buffer
        RawBuffer release_raw() && { return std::move(raw_); }

    private:
        RawBuffer raw_;
    };
}
