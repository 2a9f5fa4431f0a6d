#pragma once

#include <cstddef>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace lum
{
    enum class BufferErrorKind {
        CannotCreate,
        Overflow,
        TooFewValues,
        TooManyValues,
        MapFailed,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, BufferErrorKind);

    // thrown when a buffer operation fails
    class BufferError final : public std::runtime_error {
    public:
        static BufferError cannot_create();
        static BufferError overflow(size_t index, size_t buffer_len);
        static BufferError too_few_values(size_t provided_len, size_t buffer_len);
        static BufferError too_many_values(size_t provided_len, size_t buffer_len);
        static BufferError map_failed();

        BufferErrorKind kind() const { return kind_; }

        // `Overflow` only: the index that was out of range
        size_t index() const { return index_; }

        // `TooFewValues`/`TooManyValues` only: the number of values the caller provided
        size_t provided_len() const { return provided_len_; }

        // `Overflow`/`TooFewValues`/`TooManyValues` only: the number of elements in the buffer
        size_t buffer_len() const { return buffer_len_; }

    private:
        BufferError(
            BufferErrorKind kind,
            const std::string& message,
            size_t index = 0,
            size_t provided_len = 0,
            size_t buffer_len = 0
        );

        BufferErrorKind kind_;
        size_t index_;
        size_t provided_len_;
        size_t buffer_len_;
    };
}
