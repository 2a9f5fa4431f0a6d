#include "Buffer.h"

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/GraphicsContext.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Platform/LogLevel.h>
#include <liblumen/testing/CapturingLogSink.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>
#include <liblumen/testing/TestVertices.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace lum;
using namespace lum::testing;

namespace
{
    struct Fixture {
        std::shared_ptr<RecordingGraphicsBackend> backend = std::make_shared<RecordingGraphicsBackend>();
        GraphicsContext context{backend};
    };

    // returns the position of the first call of `kind` made with `handle`, or `std::nullopt`
    std::optional<size_t> find_call(const RecordingGraphicsBackend& backend, RecordedCallKind kind, BufferHandle handle)
    {
        const auto& calls = backend.calls();
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].kind == kind and calls[i].handle == handle.get()) {
                return i;
            }
        }
        return std::nullopt;
    }
}

TEST(Buffer, new_buffer_has_the_requested_length_and_byte_size)
{
    Fixture f;
    const Buffer<ColoredVertex> buffer = f.context.new_buffer<ColoredVertex>(5);

    ASSERT_EQ(buffer.len(), 5);
    ASSERT_EQ(buffer.bytes(), 5 * sizeof(ColoredVertex));
    ASSERT_EQ(f.backend->buffer_data(buffer.handle()).size(), 5 * sizeof(ColoredVertex));
}

TEST(Buffer, new_buffer_uses_the_contexts_default_usage_hint)
{
    Fixture f;
    const Buffer<float> buffer = f.context.new_buffer<float>(3);

    ASSERT_EQ(f.backend->buffer_usage(buffer.handle()), BufferUsage::StreamDraw);
}

TEST(Buffer, new_buffer_forces_a_bind_before_allocating_storage)
{
    Fixture f;
    const Buffer<float> first = f.context.new_buffer<float>(3);
    f.backend->clear_calls();

    // even though the cache thinks `first` is bound, creating another buffer must bind it
    const Buffer<float> second = f.context.new_buffer<float>(3);

    const auto bind = find_call(*f.backend, RecordedCallKind::BindBuffer, second.handle());
    ASSERT_TRUE(bind.has_value());
    ASSERT_EQ(f.backend->calls().at(*bind + 1).kind, RecordedCallKind::AllocateBufferStorage);
    ASSERT_EQ(f.backend->calls().at(*bind + 1).handle, second.handle().get());
}

TEST(Buffer, new_buffer_throws_CannotCreate_if_the_backend_cannot_create_a_buffer)
{
    Fixture f;
    f.backend->set_num_buffers_until_creation_fails(0);

    try {
        [[maybe_unused]] auto buffer = f.context.new_buffer<float>(3);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::CannotCreate);
    }
}

TEST(Buffer, new_buffer_throws_CannotCreate_if_the_byte_size_overflows)
{
    Fixture f;
    const size_t len = (std::numeric_limits<size_t>::max() / sizeof(uint64_t)) + 2;

    try {
        [[maybe_unused]] auto buffer = f.context.new_buffer<uint64_t>(len);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::CannotCreate);
    }
    ASSERT_EQ(f.backend->count(RecordedCallKind::CreateBuffer), 0);
    ASSERT_EQ(f.backend->num_live_buffers(), 0);
}

TEST(Buffer, new_buffer_does_not_leak_a_handle_if_storage_allocation_fails)
{
    Fixture f;
    f.backend->set_fail_storage_allocation(true);

    ASSERT_THROW({ [[maybe_unused]] auto buffer = f.context.new_buffer<float>(3); }, BufferError);
    ASSERT_EQ(f.backend->num_live_buffers(), 0);
}

TEST(Buffer, buffer_from_uploads_the_provided_values)
{
    Fixture f;
    const std::vector<uint32_t> values = {1, 2, 3, 4};

    const Buffer<uint32_t> buffer = f.context.buffer_from(values, BufferTarget::Array);

    ASSERT_EQ(buffer.len(), 4);
    ASSERT_EQ(buffer.whole(), values);
}

TEST(Buffer, buffers_of_index_types_default_to_the_element_array_target)
{
    Fixture f;
    const Buffer<uint16_t> indices = f.context.new_buffer<uint16_t>(6);
    const Buffer<float> floats = f.context.new_buffer<float>(6);

    ASSERT_EQ(indices.target(), BufferTarget::ElementArray);
    ASSERT_EQ(floats.target(), BufferTarget::Array);
}

TEST(Buffer, repeat_buffer_sets_every_element)
{
    Fixture f;
    const ColoredVertex v = colored_vertex(1.0f, 2.0f, 3.0f);

    const Buffer<ColoredVertex> buffer = f.context.repeat_buffer(4, v);

    ASSERT_EQ(buffer.whole(), std::vector<ColoredVertex>(4, v));
}

TEST(Buffer, at_returns_nullopt_when_index_is_out_of_range)
{
    Fixture f;
    const Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);

    ASSERT_EQ(buffer.at(3), std::nullopt);
    ASSERT_EQ(buffer.at(100), std::nullopt);
}

TEST(Buffer, at_does_not_touch_the_backend_when_index_is_out_of_range)
{
    Fixture f;
    const Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);
    f.backend->clear_calls();

    ASSERT_EQ(buffer.at(3), std::nullopt);
    ASSERT_TRUE(f.backend->calls().empty());
}

TEST(Buffer, set_then_at_returns_the_written_value)
{
    Fixture f;
    Buffer<ColoredVertex> buffer = f.context.new_buffer<ColoredVertex>(3);
    const ColoredVertex v = colored_vertex(4.0f, 5.0f, 6.0f);

    buffer.set(1, v);

    ASSERT_EQ(buffer.at(1), v);
}

TEST(Buffer, set_throws_Overflow_when_index_is_out_of_range)
{
    Fixture f;
    Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);

    try {
        buffer.set(3, 2.0f);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::Overflow);
        ASSERT_EQ(ex.index(), 3);
        ASSERT_EQ(ex.buffer_len(), 3);
    }
    ASSERT_EQ(buffer.whole(), std::vector<float>(3, 1.0f));
}

TEST(Buffer, write_whole_replaces_the_contents)
{
    Fixture f;
    Buffer<float> buffer = f.context.new_buffer<float>(3);
    const std::array<float, 3> values = {7.0f, 8.0f, 9.0f};

    buffer.write_whole(values);

    ASSERT_EQ(buffer.whole(), std::vector<float>(values.begin(), values.end()));
}

TEST(Buffer, write_whole_throws_TooFewValues_and_leaves_contents_intact)
{
    Fixture f;
    Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);
    const std::array<float, 2> values = {7.0f, 8.0f};

    try {
        buffer.write_whole(values);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::TooFewValues);
        ASSERT_EQ(ex.provided_len(), 2);
        ASSERT_EQ(ex.buffer_len(), 3);
    }
    ASSERT_EQ(buffer.whole(), std::vector<float>(3, 1.0f));
}

TEST(Buffer, write_whole_throws_TooManyValues)
{
    Fixture f;
    Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);
    const std::array<float, 4> values = {7.0f, 8.0f, 9.0f, 10.0f};

    try {
        buffer.write_whole(values);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::TooManyValues);
        ASSERT_EQ(ex.provided_len(), 4);
    }
}

TEST(Buffer, empty_buffer_can_be_written_and_read_without_mapping)
{
    Fixture f;
    Buffer<float> buffer = f.context.new_buffer<float>(0);
    f.backend->clear_calls();

    buffer.write_whole({});
    ASSERT_TRUE(buffer.whole().empty());
    ASSERT_EQ(f.backend->count(RecordedCallKind::MapBufferRange), 0);
}

TEST(Buffer, clear_sets_every_element)
{
    Fixture f;
    Buffer<uint32_t> buffer = f.context.buffer_from(std::vector<uint32_t>{1, 2, 3}, BufferTarget::Array);

    buffer.clear(42);

    ASSERT_EQ(buffer.whole(), std::vector<uint32_t>(3, 42));
}

TEST(Buffer, slice_mut_writes_are_visible_after_the_slice_is_destroyed)
{
    Fixture f;
    Buffer<float> buffer = f.context.repeat_buffer(3, 0.0f);
    {
        const BufferSliceMut<float> slice = buffer.slice_mut();
        ASSERT_EQ(slice.size(), 3);
        slice[2] = 5.0f;
        ASSERT_TRUE(f.backend->is_mapped(buffer.handle()));
    }
    ASSERT_FALSE(f.backend->is_mapped(buffer.handle()));
    ASSERT_EQ(buffer.at(2), 5.0f);
}

TEST(Buffer, slice_is_unmapped_when_an_exception_is_thrown)
{
    Fixture f;
    const Buffer<float> buffer = f.context.repeat_buffer(3, 0.0f);

    try {
        [[maybe_unused]] const BufferSlice<float> slice = buffer.slice();
        throw std::runtime_error{"something went wrong while mapped"};
    }
    catch (const std::runtime_error&) {
    }
    ASSERT_FALSE(f.backend->is_mapped(buffer.handle()));
}

TEST(Buffer, mapping_failure_throws_MapFailed)
{
    Fixture f;
    const Buffer<float> buffer = f.context.repeat_buffer(3, 0.0f);
    f.backend->set_fail_mapping(true);

    try {
        [[maybe_unused]] const auto v = buffer.at(0);
        FAIL() << "should have thrown";
    }
    catch (const BufferError& ex) {
        ASSERT_EQ(ex.kind(), BufferErrorKind::MapFailed);
    }
}

TEST(Buffer, unmapping_failure_is_logged_as_an_error)
{
    Fixture f;
    Buffer<float> buffer = f.context.repeat_buffer(3, 0.0f);
    f.backend->set_fail_unmapping(true);
    auto sink = std::make_shared<CapturingLogSink>();
    const ScopedLogSinkAttachment attachment{sink};

    buffer.set(0, 1.0f);

    ASSERT_TRUE(sink->contains_at_level(LogLevel::err));
}

TEST(Buffer, mapping_rebinds_the_buffer_if_something_else_was_bound)
{
    Fixture f;
    const Buffer<float> a = f.context.repeat_buffer(3, 1.0f);
    const Buffer<float> b = f.context.repeat_buffer(3, 2.0f);

    // `b` was bound last, so reading `a` must rebind `a`
    ASSERT_EQ(a.at(0), 1.0f);
    ASSERT_EQ(b.at(0), 2.0f);
}

TEST(Buffer, repeated_reads_of_the_same_buffer_elide_binds)
{
    Fixture f;
    const Buffer<float> buffer = f.context.repeat_buffer(3, 1.0f);
    f.backend->clear_calls();

    for (size_t i = 0; i < 3; ++i) {
        ASSERT_EQ(buffer.at(i), 1.0f);
    }
    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 0);
}

TEST(Buffer, destruction_unbinds_then_deletes_exactly_once)
{
    Fixture f;
    BufferHandle handle;
    {
        const Buffer<float> buffer = f.context.new_buffer<float>(3);
        handle = buffer.handle();
        f.backend->clear_calls();
    }

    const auto unbind = std::ranges::find_if(f.backend->calls(), [](const RecordedCall& c)
    {
        return c.kind == RecordedCallKind::BindBuffer and c.handle == 0;
    });
    const auto del = find_call(*f.backend, RecordedCallKind::DeleteBuffer, handle);

    ASSERT_NE(unbind, f.backend->calls().end());
    ASSERT_TRUE(del.has_value());
    ASSERT_LT(std::distance(f.backend->calls().begin(), unbind), static_cast<std::ptrdiff_t>(*del));
    ASSERT_EQ(f.backend->count(RecordedCallKind::DeleteBuffer), 1);
}

TEST(Buffer, moved_from_buffer_does_not_delete_the_handle)
{
    Fixture f;
    Buffer<float> a = f.context.new_buffer<float>(3);
    const BufferHandle handle = a.handle();
    {
        const Buffer<float> b = std::move(a);
        ASSERT_EQ(b.handle(), handle);
        ASSERT_EQ(f.backend->count(RecordedCallKind::DeleteBuffer), 0);
    }
    ASSERT_EQ(f.backend->count(RecordedCallKind::DeleteBuffer), 1);
    ASSERT_FALSE(f.backend->is_live(handle));
}

TEST(Buffer, can_outlive_the_context_it_was_created_from)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    std::optional<Buffer<float>> buffer;
    {
        GraphicsContext context{backend};
        buffer.emplace(context.repeat_buffer(2, 3.0f));
    }
    ASSERT_EQ(buffer->at(1), 3.0f);

    buffer.reset();
    ASSERT_EQ(backend->num_live_buffers(), 0);
}

TEST(Buffer, destroying_a_bound_buffer_leaves_the_cache_agreeing_with_the_backend)
{
    Fixture f;
    {
        const Buffer<float> buffer = f.context.new_buffer<float>(3);
        ASSERT_EQ(f.context.state().bound_buffer(BufferTarget::Array), buffer.handle());
    }
    ASSERT_EQ(f.context.state().bound_buffer(BufferTarget::Array), BufferHandle{});
    ASSERT_EQ(f.backend->actual_bound_buffer(BufferTarget::Array), BufferHandle{});
}
