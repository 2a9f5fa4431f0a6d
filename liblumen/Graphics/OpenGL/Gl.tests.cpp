#include "Gl.h"

#include <GL/glew.h>
#include <gtest/gtest.h>

using namespace lum;

// these conversions are pure, so they can be tested without an OpenGL context

TEST(gl, to_gl_target_maps_each_buffer_target)
{
    ASSERT_EQ(gl::to_gl_target(BufferTarget::Array), static_cast<GLenum>(GL_ARRAY_BUFFER));
    ASSERT_EQ(gl::to_gl_target(BufferTarget::ElementArray), static_cast<GLenum>(GL_ELEMENT_ARRAY_BUFFER));
}

TEST(gl, to_gl_binding_query_maps_each_buffer_target_to_its_binding)
{
    ASSERT_EQ(gl::to_gl_binding_query(BufferTarget::Array), static_cast<GLenum>(GL_ARRAY_BUFFER_BINDING));
    ASSERT_EQ(gl::to_gl_binding_query(BufferTarget::ElementArray), static_cast<GLenum>(GL_ELEMENT_ARRAY_BUFFER_BINDING));
}

TEST(gl, to_gl_index_type_maps_each_index_width)
{
    ASSERT_EQ(gl::to_gl_index_type(TessIndexType::U8), static_cast<GLenum>(GL_UNSIGNED_BYTE));
    ASSERT_EQ(gl::to_gl_index_type(TessIndexType::U16), static_cast<GLenum>(GL_UNSIGNED_SHORT));
    ASSERT_EQ(gl::to_gl_index_type(TessIndexType::U32), static_cast<GLenum>(GL_UNSIGNED_INT));
}

TEST(gl, to_gl_map_access_sets_the_right_bits)
{
    ASSERT_EQ(gl::to_gl_map_access(BufferMapAccess::Read), static_cast<GLbitfield>(GL_MAP_READ_BIT));
    ASSERT_EQ(gl::to_gl_map_access(BufferMapAccess::ReadWrite), static_cast<GLbitfield>(GL_MAP_READ_BIT | GL_MAP_WRITE_BIT));
}

TEST(gl, to_gl_component_type_uses_the_formats_component_type)
{
    ASSERT_EQ(gl::to_gl_component_type(VertexAttributeFormat::Float32x4), static_cast<GLenum>(GL_FLOAT));
    ASSERT_EQ(gl::to_gl_component_type(VertexAttributeFormat::Unorm8x4), static_cast<GLenum>(GL_UNSIGNED_BYTE));
    ASSERT_EQ(gl::to_gl_component_type(VertexAttributeFormat::Int32), static_cast<GLenum>(GL_INT));
}

TEST(gl, to_gl_primitive_maps_patches)
{
    ASSERT_EQ(gl::to_gl_primitive(TessPrimitive::Patch), static_cast<GLenum>(GL_PATCHES));
    ASSERT_EQ(gl::to_gl_primitive(TessPrimitive::TriangleStrip), static_cast<GLenum>(GL_TRIANGLE_STRIP));
}
