#include "VertexAttributeDescriptor.h"

#include <cstddef>
#include <ostream>

std::ostream& lum::operator<<(std::ostream& o, const VertexAttributeDescriptor& desc)
{
    return o << "VertexAttributeDescriptor(location = " << desc.location() << ", format = " << desc.format() << ", offset = " << desc.offset() << ')';
}
