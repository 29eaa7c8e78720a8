/// @file JsonWriter.hpp
/// @brief Writers binding the JSON event writer to a string, a blocking sink or a non-blocking sink.
#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/ByteConcepts.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/JSON/JsonError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonEventWriter.hpp>

#include <span>
#include <string>
#include <utility>

namespace JEVT::Serialization
{
    struct JsonWriterOptions
    {
        /// Encoded bytes are handed to the sink once this many are pending.
        UIntSize flushThreshold {4096};
    };

    /// @brief Serializes events into an owned std::string.
    class JEVT_API JsonStringWriter
    {
    public:
        JsonExpected<void> WriteEvent(const JsonEvent& event);

        /// @brief Fails unless exactly one complete root value was written.
        JsonExpected<void> Finish() const;

        [[nodiscard]] const std::string& Output() const noexcept { return m_output; }
        [[nodiscard]] std::string        TakeOutput() noexcept { return std::move(m_output); }

    private:
        JsonEventWriter m_writer;
        std::string     m_output;
    };

    namespace detail
    {
        [[nodiscard]] inline std::span<const Byte> AsBytes(const std::string& text) noexcept
        {
            return {reinterpret_cast<const Byte*>(text.data()), text.size()};
        }
    }// namespace detail

    /// @brief Serializes events to a blocking byte sink through an internal buffer.
    /// @details Call Finish() at the end to validate the document and flush what is
    /// still buffered; nothing is flushed on destruction.
    template<IO::ByteWriter TWriter>
    class JsonStreamWriter
    {
    public:
        explicit JsonStreamWriter(TWriter& writer, const JsonWriterOptions& options = {})
            : m_sink(writer), m_options(options)
        {
        }

        JsonExpected<void> WriteEvent(const JsonEvent& event)
        {
            auto written = m_writer.Write(event, m_buffer);
            if (!written)
                return std::unexpected(JsonError::FromUsage(std::move(written.error())));
            if (m_buffer.size() >= m_options.flushThreshold)
                return FlushBuffer();
            return {};
        }

        JsonExpected<void> Finish()
        {
            auto complete = m_writer.Finish();
            if (!complete)
                return std::unexpected(JsonError::FromUsage(std::move(complete.error())));
            auto flushed = FlushBuffer();
            if (!flushed)
                return flushed;
            auto sinkFlushed = m_sink.Flush();
            if (!sinkFlushed)
                return std::unexpected(JsonError::FromTransport(std::move(sinkFlushed.error())));
            return {};
        }

    private:
        JsonExpected<void> FlushBuffer()
        {
            UIntSize offset = 0;
            while (offset < m_buffer.size())
            {
                auto written = m_sink.Write(detail::AsBytes(m_buffer).subspan(offset));
                if (!written || *written == 0)
                {
                    // Keep the unwritten tail so a later Finish can retry.
                    m_buffer.erase(0, offset);
                    if (!written)
                        return std::unexpected(JsonError::FromTransport(std::move(written.error())));
                    return std::unexpected(JsonError::FromTransport(
                            IO::MakeIOError(IO::IOErrorCode::BufferFull, "byte sink accepted no data")));
                }
                offset += *written;
            }
            m_buffer.clear();
            return {};
        }

        TWriter&          m_sink;
        JsonWriterOptions m_options;
        JsonEventWriter   m_writer;
        std::string       m_buffer;
    };

    /// @brief Serializes events to a non-blocking byte sink.
    /// @details WriteEvent never blocks: it encodes the event, queues the bytes and
    /// hands the sink as much as it takes right now. Flush() fails with a
    /// WouldBlock transport error while queued bytes remain; call it again once the
    /// sink is writable.
    ///
    /// Once at least JsonWriterOptions::flushThreshold bytes stay queued because the
    /// sink is blocked, WriteEvent also fails with WouldBlock. The event itself was
    /// queued and must not be written again; Flush() until it succeeds before
    /// writing the next event.
    template<IO::NonBlockingByteWriter TWriter>
    class JsonNonBlockingWriter
    {
    public:
        explicit JsonNonBlockingWriter(TWriter& writer, const JsonWriterOptions& options = {})
            : m_sink(writer), m_options(options)
        {
        }

        JsonExpected<void> WriteEvent(const JsonEvent& event)
        {
            auto written = m_writer.Write(event, m_pending);
            if (!written)
                return std::unexpected(JsonError::FromUsage(std::move(written.error())));
            if (PendingBytes() < m_options.flushThreshold)
                return {};
            auto drained = Drain();
            if (!drained && drained.error().IsWouldBlock() && PendingBytes() < m_options.flushThreshold)
                return {};
            return drained;
        }

        JsonExpected<void> Flush()
        {
            return Drain();
        }

        /// @brief Validate the document, then Flush().
        JsonExpected<void> Finish()
        {
            auto complete = m_writer.Finish();
            if (!complete)
                return std::unexpected(JsonError::FromUsage(std::move(complete.error())));
            return Drain();
        }

        [[nodiscard]] UIntSize PendingBytes() const noexcept { return m_pending.size(); }

    private:
        JsonExpected<void> Drain()
        {
            JsonExpected<void> result {};
            UIntSize           sent = 0;
            while (sent < m_pending.size())
            {
                auto written = m_sink.TryWrite(detail::AsBytes(m_pending).subspan(sent));
                if (!written)
                {
                    result = std::unexpected(JsonError::FromTransport(std::move(written.error())));
                    break;
                }
                if (*written == 0)
                {
                    result = std::unexpected(JsonError::FromTransport(
                            IO::MakeIOError(IO::IOErrorCode::WouldBlock, "byte sink accepted no data")));
                    break;
                }
                sent += *written;
            }
            m_pending.erase(0, sent);
            return result;
        }

        TWriter&          m_sink;
        JsonWriterOptions m_options;
        JsonEventWriter   m_writer;
        std::string       m_pending;
    };
}// namespace JEVT::Serialization
