#pragma once

namespace lum
{
    // the dialect of OpenGL that an `OpenGLGraphicsBackend` targets
    enum class OpenGLFlavor {
        // desktop OpenGL 3.3 core (plus tessellation patches, if available)
        Desktop33,

        // OpenGL ES 3.0, or WebGL2 (fixed-index primitive restart, no patches)
        ES30,

        NUM_OPTIONS,
    };

    struct OpenGLGraphicsBackendParams final {
        friend bool operator==(const OpenGLGraphicsBackendParams&, const OpenGLGraphicsBackendParams&) = default;

        OpenGLFlavor flavor = OpenGLFlavor::Desktop33;

        // set this to `false` if the application already initialized GLEW
        bool initialize_glew = true;
    };
}
