#pragma once

#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/Buffer.h>
#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferMapping.h>
#include <liblumen/Graphics/BufferSlice.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Graphics/DrawCommand.h>
#include <liblumen/Graphics/GraphicsBackendState.h>
#include <liblumen/Graphics/GraphicsContext.h>
#include <liblumen/Graphics/GraphicsContextParams.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/GraphicsStateStats.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Graphics/StateQueryError.h>
#include <liblumen/Graphics/Tess.h>
#include <liblumen/Graphics/TessBuilder.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/Graphics/TessGate.h>
#include <liblumen/Graphics/TessIndex.h>
#include <liblumen/Graphics/TessMapError.h>
#include <liblumen/Graphics/TessMode.h>
#include <liblumen/Graphics/TessView.h>
#include <liblumen/Graphics/Vertex.h>
#include <liblumen/Graphics/VertexArray.h>
#include <liblumen/Graphics/VertexAttributeBinding.h>
#include <liblumen/Graphics/VertexAttributeDescriptor.h>
#include <liblumen/Graphics/VertexAttributeFormat.h>
#include <liblumen/Graphics/VertexLayout.h>
