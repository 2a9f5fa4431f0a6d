#include "OpenGLGraphicsBackend.h"

#include <liblumen/Graphics/OpenGL/Gl.h>
#include <liblumen/Platform/Log.h>

#include <GL/glew.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

using namespace lum;

namespace
{
    void initialize_glew()
    {
        glewExperimental = GL_TRUE;  // required for core profiles
        if (const GLenum err = glewInit(); err != GLEW_OK) {
            std::stringstream ss;
            ss << LUM_GL_SOURCELOC ": glewInit() failed: " << reinterpret_cast<const char*>(glewGetErrorString(err));
            throw gl::OpenGLException{std::move(ss).str()};
        }

        // `glewInit` can leave a spurious `GL_INVALID_ENUM` in the error queue on core profiles
        gl::clear_errors();
    }

    const char* get_string(GLenum name)
    {
        const GLubyte* rv = glGetString(name);
        return rv != nullptr ? reinterpret_cast<const char*>(rv) : "(unknown)";
    }
}

lum::OpenGLGraphicsBackend::OpenGLGraphicsBackend(const OpenGLGraphicsBackendParams& params) :
    params_{params}
{
    if (params_.initialize_glew) {
        initialize_glew();
    }

    supports_patches_ =
        params_.flavor == OpenGLFlavor::Desktop33 and
        (GLEW_VERSION_4_0 or GLEW_ARB_tessellation_shader);

    log_debug("OpenGL: vendor = %s, renderer = %s, version = %s",
        get_string(GL_VENDOR),
        get_string(GL_RENDERER),
        get_string(GL_VERSION)
    );
}

std::string_view lum::OpenGLGraphicsBackend::impl_name() const
{
    return params_.flavor == OpenGLFlavor::Desktop33 ? "OpenGL 3.3 (core)" : "OpenGL ES 3.0";
}

std::optional<GraphicsBackendState> lum::OpenGLGraphicsBackend::impl_query_state()
{
    gl::clear_errors();

    GraphicsBackendState rv;
    rv.array_buffer = BufferHandle{static_cast<uint32_t>(gl::get_integer(gl::to_gl_binding_query(BufferTarget::Array)))};
    rv.element_array_buffer = BufferHandle{static_cast<uint32_t>(gl::get_integer(gl::to_gl_binding_query(BufferTarget::ElementArray)))};
    rv.vertex_array = VertexArrayHandle{static_cast<uint32_t>(gl::get_integer(GL_VERTEX_ARRAY_BINDING))};
    rv.limits.max_vertex_attributes = static_cast<size_t>(gl::get_integer(GL_MAX_VERTEX_ATTRIBS));

    if (params_.flavor == OpenGLFlavor::Desktop33) {
        if (glIsEnabled(GL_PRIMITIVE_RESTART) == GL_TRUE) {
            rv.primitive_restart_index = static_cast<uint32_t>(gl::get_integer(GL_PRIMITIVE_RESTART_INDEX));
        }
        rv.limits.supports_arbitrary_primitive_restart_index = true;
    }
    else {
        if (glIsEnabled(GL_PRIMITIVE_RESTART_FIXED_INDEX) == GL_TRUE) {
            rv.primitive_restart_index = primitive_restart_sentinel_of(TessIndexType::U32);
        }
        rv.limits.supports_arbitrary_primitive_restart_index = false;
    }

    if (supports_patches_) {
        rv.limits.supports_patches = true;
        rv.limits.max_patch_vertices = static_cast<size_t>(gl::get_integer(GL_MAX_PATCH_VERTICES));
    }

    if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
        log_error("OpenGL: querying the initial state of the context failed: %s", gl::error_string(err));
        return std::nullopt;
    }
    return rv;
}

std::optional<BufferHandle> lum::OpenGLGraphicsBackend::impl_create_buffer()
{
    GLuint handle = 0;
    glGenBuffers(1, &handle);
    if (handle == 0) {
        return std::nullopt;
    }
    return BufferHandle{handle};
}

void lum::OpenGLGraphicsBackend::impl_delete_buffer(BufferHandle handle)
{
    const GLuint raw = handle.get();
    glDeleteBuffers(1, &raw);
}

void lum::OpenGLGraphicsBackend::impl_bind_buffer(BufferTarget target, BufferHandle handle)
{
    gl::bind_buffer(gl::to_gl_target(target), handle.get());
}

bool lum::OpenGLGraphicsBackend::impl_allocate_buffer_storage(BufferTarget target, size_t num_bytes, const void* data, BufferUsage usage)
{
    gl::clear_errors();
    gl::buffer_data(gl::to_gl_target(target), num_bytes, data, gl::to_gl_usage(usage));

    if (const GLenum err = glGetError(); err != GL_NO_ERROR) {
        log_error("OpenGL: glBufferData(%zu bytes) failed: %s", num_bytes, gl::error_string(err));
        return false;
    }
    return true;
}

void* lum::OpenGLGraphicsBackend::impl_map_buffer_range(BufferTarget target, size_t byte_offset, size_t num_bytes, BufferMapAccess access)
{
    return glMapBufferRange(
        gl::to_gl_target(target),
        static_cast<GLintptr>(byte_offset),
        static_cast<GLsizeiptr>(num_bytes),
        gl::to_gl_map_access(access)
    );
}

bool lum::OpenGLGraphicsBackend::impl_unmap_buffer(BufferTarget target)
{
    return glUnmapBuffer(gl::to_gl_target(target)) == GL_TRUE;
}

std::optional<VertexArrayHandle> lum::OpenGLGraphicsBackend::impl_create_vertex_array()
{
    GLuint handle = 0;
    glGenVertexArrays(1, &handle);
    if (handle == 0) {
        return std::nullopt;
    }
    return VertexArrayHandle{handle};
}

void lum::OpenGLGraphicsBackend::impl_delete_vertex_array(VertexArrayHandle handle)
{
    const GLuint raw = handle.get();
    glDeleteVertexArrays(1, &raw);
}

void lum::OpenGLGraphicsBackend::impl_bind_vertex_array(VertexArrayHandle handle)
{
    gl::bind_vertex_array(handle.get());
}

void lum::OpenGLGraphicsBackend::impl_set_vertex_attribute(const VertexAttributeBinding& binding)
{
    const auto num_components = static_cast<GLint>(num_components_in(binding.format));
    const GLenum component_type = gl::to_gl_component_type(binding.format);
    const auto stride = static_cast<GLsizei>(binding.stride);

    if (is_integral(binding.format)) {
        glVertexAttribIPointer(binding.location, num_components, component_type, stride, gl::buffer_offset(binding.offset));
    }
    else {
        const GLboolean normalized = is_normalized(binding.format) ? GL_TRUE : GL_FALSE;
        glVertexAttribPointer(binding.location, num_components, component_type, normalized, stride, gl::buffer_offset(binding.offset));
    }
    glEnableVertexAttribArray(binding.location);
    glVertexAttribDivisor(binding.location, binding.divisor);
}

void lum::OpenGLGraphicsBackend::impl_set_primitive_restart(std::optional<uint32_t> restart_index)
{
    const GLenum capability = params_.flavor == OpenGLFlavor::Desktop33 ? GL_PRIMITIVE_RESTART : GL_PRIMITIVE_RESTART_FIXED_INDEX;

    if (not restart_index) {
        glDisable(capability);
        return;
    }

    glEnable(capability);
    if (params_.flavor == OpenGLFlavor::Desktop33) {
        glPrimitiveRestartIndex(*restart_index);
    }
}

void lum::OpenGLGraphicsBackend::impl_draw(const DrawCommand& command)
{
    const GLenum mode = gl::to_gl_primitive(command.mode.primitive());
    const auto count = static_cast<GLsizei>(command.vert_nb);
    const auto instances = static_cast<GLsizei>(command.inst_nb);

    if (command.mode.is_patch()) {
        glPatchParameteri(GL_PATCH_VERTICES, static_cast<GLint>(command.mode.vertices_per_patch()));
    }

    if (command.index_type) {
        const GLenum type = gl::to_gl_index_type(*command.index_type);
        const void* first = gl::buffer_offset(command.start_index * size_of(*command.index_type));
        if (command.inst_nb > 0) {
            glDrawElementsInstanced(mode, count, type, first, instances);
        }
        else {
            glDrawElements(mode, count, type, first);
        }
    }
    else {
        const auto first = static_cast<GLint>(command.start_index);
        if (command.inst_nb > 0) {
            glDrawArraysInstanced(mode, first, count, instances);
        }
        else {
            glDrawArrays(mode, first, count);
        }
    }
}
