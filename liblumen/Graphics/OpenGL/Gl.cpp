#include "Gl.h"

#include <GL/glew.h>

#include <cstddef>

using namespace lum;

void lum::gl::clear_errors()
{
    // bounded, because a lost context can report errors forever
    for (size_t i = 0; i < 64 and glGetError() != GL_NO_ERROR; ++i) {
    }
}

const char* lum::gl::error_string(GLenum error)
{
    switch (error) {
    case GL_NO_ERROR:                      return "GL_NO_ERROR";
    case GL_INVALID_ENUM:                  return "GL_INVALID_ENUM";
    case GL_INVALID_VALUE:                 return "GL_INVALID_VALUE";
    case GL_INVALID_OPERATION:             return "GL_INVALID_OPERATION";
    case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
    case GL_OUT_OF_MEMORY:                 return "GL_OUT_OF_MEMORY";
    default:                               return "unknown OpenGL error";
    }
}

GLenum lum::gl::to_gl_target(BufferTarget target)
{
    switch (target) {
    case BufferTarget::ElementArray: return GL_ELEMENT_ARRAY_BUFFER;
    case BufferTarget::Array:
    default:                         return GL_ARRAY_BUFFER;
    }
}

GLenum lum::gl::to_gl_binding_query(BufferTarget target)
{
    switch (target) {
    case BufferTarget::ElementArray: return GL_ELEMENT_ARRAY_BUFFER_BINDING;
    case BufferTarget::Array:
    default:                         return GL_ARRAY_BUFFER_BINDING;
    }
}

GLenum lum::gl::to_gl_usage(BufferUsage usage)
{
    switch (usage) {
    case BufferUsage::StaticDraw:  return GL_STATIC_DRAW;
    case BufferUsage::DynamicDraw: return GL_DYNAMIC_DRAW;
    case BufferUsage::StreamDraw:
    default:                       return GL_STREAM_DRAW;
    }
}

GLbitfield lum::gl::to_gl_map_access(BufferMapAccess access)
{
    switch (access) {
    case BufferMapAccess::Read:      return GL_MAP_READ_BIT;
    case BufferMapAccess::Write:     return GL_MAP_WRITE_BIT;
    case BufferMapAccess::ReadWrite:
    default:                         return GL_MAP_READ_BIT | GL_MAP_WRITE_BIT;
    }
}

GLenum lum::gl::to_gl_primitive(TessPrimitive primitive)
{
    switch (primitive) {
    case TessPrimitive::Point:         return GL_POINTS;
    case TessPrimitive::Line:          return GL_LINES;
    case TessPrimitive::LineStrip:     return GL_LINE_STRIP;
    case TessPrimitive::TriangleFan:   return GL_TRIANGLE_FAN;
    case TessPrimitive::TriangleStrip: return GL_TRIANGLE_STRIP;
    case TessPrimitive::Patch:         return GL_PATCHES;
    case TessPrimitive::Triangle:
    default:                           return GL_TRIANGLES;
    }
}

GLenum lum::gl::to_gl_index_type(TessIndexType index_type)
{
    switch (index_type) {
    case TessIndexType::U8:  return GL_UNSIGNED_BYTE;
    case TessIndexType::U16: return GL_UNSIGNED_SHORT;
    case TessIndexType::U32:
    default:                 return GL_UNSIGNED_INT;
    }
}

GLenum lum::gl::to_gl_component_type(VertexAttributeFormat format)
{
    switch (component_type_of(format)) {
    case VertexAttributeComponentType::Uint8:  return GL_UNSIGNED_BYTE;
    case VertexAttributeComponentType::Int8:   return GL_BYTE;
    case VertexAttributeComponentType::Uint32: return GL_UNSIGNED_INT;
    case VertexAttributeComponentType::Int32:  return GL_INT;
    case VertexAttributeComponentType::Float32:
    default:                                   return GL_FLOAT;
    }
}
