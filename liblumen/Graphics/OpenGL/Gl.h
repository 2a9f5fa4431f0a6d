#pragma once

#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Graphics/TessIndex.h>
#include <liblumen/Graphics/TessMode.h>
#include <liblumen/Graphics/VertexAttributeFormat.h>

#include <GL/glew.h>

#include <cstddef>
#include <stdexcept>
#include <string>

#define LUM_GL_STRINGIFY(x) #x
#define LUM_GL_TOSTRING(x) LUM_GL_STRINGIFY(x)
#define LUM_GL_SOURCELOC __FILE__ ":" LUM_GL_TOSTRING(__LINE__)

// gl: convenience C++ bindings to the parts of OpenGL that `liblumen` uses
namespace lum::gl
{
    // an exception that specifically means something has gone wrong in
    // the OpenGL API
    class OpenGLException final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // pops every pending error off of OpenGL's error queue
    void clear_errors();

    // returns the name of a `glGetError` code (e.g. "GL_OUT_OF_MEMORY")
    const char* error_string(GLenum);

    // https://registry.khronos.org/OpenGL-Refpages/gl4/html/glGet.xhtml
    inline GLint get_integer(GLenum pname)
    {
        GLint rv = 0;
        glGetIntegerv(pname, &rv);
        return rv;
    }

    GLenum to_gl_target(BufferTarget);
    GLenum to_gl_binding_query(BufferTarget);
    GLenum to_gl_usage(BufferUsage);
    GLbitfield to_gl_map_access(BufferMapAccess);
    GLenum to_gl_primitive(TessPrimitive);
    GLenum to_gl_index_type(TessIndexType);
    GLenum to_gl_component_type(VertexAttributeFormat);

    // https://registry.khronos.org/OpenGL-Refpages/gl4/html/glBindBuffer.xhtml
    inline void bind_buffer(GLenum target, GLuint handle)
    {
        glBindBuffer(target, handle);
    }

    // https://registry.khronos.org/OpenGL-Refpages/gl4/html/glBufferData.xhtml
    inline void buffer_data(GLenum target, size_t num_bytes, const void* data, GLenum usage)
    {
        glBufferData(target, static_cast<GLsizeiptr>(num_bytes), data, usage);
    }

    // https://registry.khronos.org/OpenGL-Refpages/gl4/html/glBindVertexArray.xhtml
    inline void bind_vertex_array(GLuint handle)
    {
        glBindVertexArray(handle);
    }

    // returns a pointer that can be passed as the `pointer`/`indices` argument to
    // OpenGL functions that read from the currently-bound buffer
    inline const void* buffer_offset(size_t num_bytes)
    {
        return reinterpret_cast<const void*>(num_bytes);  // NOLINT(performance-no-int-to-ptr)
    }
}
