#include "BufferError.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

using namespace lum;

namespace
{
    constexpr auto c_buffer_error_kind_strings = std::to_array<std::string_view>({
        "CannotCreate",
        "Overflow",
        "TooFewValues",
        "TooManyValues",
        "MapFailed",
    });
    static_assert(c_buffer_error_kind_strings.size() == num_options<BufferErrorKind>());
}

std::ostream& lum::operator<<(std::ostream& o, BufferErrorKind kind)
{
    return o << c_buffer_error_kind_strings.at(to_index(kind));
}

lum::BufferError::BufferError(
    BufferErrorKind kind,
    const std::string& message,
    size_t index,
    size_t provided_len,
    size_t buffer_len) :

    std::runtime_error{message},
    kind_{kind},
    index_{index},
    provided_len_{provided_len},
    buffer_len_{buffer_len}
{}

BufferError lum::BufferError::cannot_create()
{
    return BufferError{BufferErrorKind::CannotCreate, "cannot create buffer: the backend could not allocate a native buffer object"};
}

BufferError lum::BufferError::overflow(size_t index, size_t buffer_len)
{
    std::stringstream ss;
    ss << "buffer overflow: tried to access index " << index << " in a buffer containing " << buffer_len << " elements";
    return BufferError{BufferErrorKind::Overflow, std::move(ss).str(), index, 0, buffer_len};
}

BufferError lum::BufferError::too_few_values(size_t provided_len, size_t buffer_len)
{
    std::stringstream ss;
    ss << "too few values: " << provided_len << " values were provided for a buffer containing " << buffer_len << " elements";
    return BufferError{BufferErrorKind::TooFewValues, std::move(ss).str(), 0, provided_len, buffer_len};
}

BufferError lum::BufferError::too_many_values(size_t provided_len, size_t buffer_len)
{
    std::stringstream ss;
    ss << "too many values: " << provided_len << " values were provided for a buffer containing " << buffer_len << " elements";
    return BufferError{BufferErrorKind::TooManyValues, std::move(ss).str(), 0, provided_len, buffer_len};
}

BufferError lum::BufferError::map_failed()
{
    return BufferError{BufferErrorKind::MapFailed, "buffer mapping failed: the backend returned a null pointer"};
}
