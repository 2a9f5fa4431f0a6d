#pragma once

#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferMapping.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Utils/Assertions.h>

#include <cstddef>
#include <span>
#include <type_traits>

namespace lum
{
    // a read-only, typed, scoped mapping of a whole buffer
    //
    // bounded by the buffer's element count. The buffer is unmapped when the
    // slice is destroyed.
    template<typename T>
    requires std::is_trivially_copyable_v<T>
    class BufferSlice final {
    public:
        using value_type = T;
        using const_iterator = typename std::span<const T>::iterator;

        explicit BufferSlice(const RawBuffer& buffer) :
            mapping_{buffer, 0, buffer.bytes(), BufferMapAccess::Read},
            elements_{reinterpret_cast<const T*>(mapping_.data()), buffer.len()}
        {
            LUM_ASSERT(buffer.element_size() == sizeof(T));
        }

        size_t size() const { return elements_.size(); }
        bool empty() const { return elements_.empty(); }
        const T* data() const { return elements_.data(); }
        const T& operator[](size_t i) const { return elements_[i]; }
        const_iterator begin() const { return elements_.begin(); }
        const_iterator end() const { return elements_.end(); }

        operator std::span<const T> () const { return elements_; }

    private:
        BufferMapping mapping_;
        std::span<const T> elements_;
    };

    // a read-write, typed, scoped mapping of a whole buffer
    //
    // writes made through the slice are visible to the GPU once the slice is destroyed
    template<typename T>
    requires std::is_trivially_copyable_v<T>
    class BufferSliceMut final {
    public:
        using value_type = T;
        using iterator = typename std::span<T>::iterator;

        explicit BufferSliceMut(const RawBuffer& buffer) :
            mapping_{buffer, 0, buffer.bytes(), BufferMapAccess::ReadWrite},
            elements_{reinterpret_cast<T*>(mapping_.data()), buffer.len()}
        {
            LUM_ASSERT(buffer.element_size() == sizeof(T));
        }

        size_t size() const { return elements_.size(); }
        bool empty() const { return elements_.empty(); }
        T* data() const { return elements_.data(); }
        T& operator[](size_t i) const { return elements_[i]; }
        iterator begin() const { return elements_.begin(); }
        iterator end() const { return elements_.end(); }

        operator std::span<T> () const { return elements_; }
        operator std::span<const T> () const { return elements_; }

    private:
        BufferMapping mapping_;
        std::span<T> elements_;
    };
}
