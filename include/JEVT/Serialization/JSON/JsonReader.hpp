/// @file JsonReader.hpp
/// @brief Readers binding the JSON tokenizer to a byte buffer, a blocking source or a non-blocking source.
#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/ByteConcepts.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/JSON/Detail/JsonInputBuffer.hpp>
#include <JEVT/Serialization/JSON/JsonError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace JEVT::Serialization
{
    /// @brief Reads events from a complete in-memory document.
    /// @details Borrowed text in returned events points into the caller's buffer,
    /// which must outlive the events.
    class JEVT_API JsonBufferReader
    {
    public:
        explicit JsonBufferReader(std::span<const Byte> input, const JsonReaderOptions& options = {});
        explicit JsonBufferReader(std::string_view input, const JsonReaderOptions& options = {});

        [[nodiscard]] ParseExpected<JsonEvent> ReadNextEvent();

        /// @brief Consume the next value and return its exact source text.
        /// @details Valid at the root, as an array element or after an object key.
        /// Returns std::nullopt (having consumed the EndArray) when the current array
        /// closes instead of holding another element.
        [[nodiscard]] JsonExpected<std::optional<std::string_view>> ReadNextValueRaw();

        [[nodiscard]] ParseLocation Location() const noexcept { return m_tokenizer.Location(); }

    private:
        std::string_view m_input;
        UIntSize         m_position {0};
        JsonTokenizer    m_tokenizer;
    };

    namespace detail
    {
        [[nodiscard]] inline JsonError MakeInvalidRawReadError()
        {
            return JsonError::FromUsage(JsonUsageError {JsonUsageErrorCode::InvalidState,
                                                        "No JSON value can start at the current position"});
        }

        /// Pull events until one is complete, refilling @p buffer through @p fill.
        template<typename TFill>
        JsonExpected<JsonEvent> ReadNextEvent(JsonTokenizer& tokenizer, JsonInputBuffer& buffer, TFill&& fill)
        {
            while (true)
            {
                auto result = tokenizer.Next(buffer.Window(), buffer.IsEnding());
                buffer.Consume(result.consumedBytes);
                if (result.event)
                {
                    if (!*result.event)
                        return std::unexpected(JsonError::FromSyntax(std::move(result.event->error())));
                    return std::move(**result.event);
                }

                auto target = buffer.PrepareWrite();
                if (!target)
                    return std::unexpected(JsonError::FromTransport(std::move(target.error())));
                IO::IOExpected<UIntSize> read = fill(*target);
                if (!read)
                    return std::unexpected(JsonError::FromTransport(std::move(read.error())));
                buffer.Commit(*read);
            }
        }
    }// namespace detail

    /// @brief Reads events from a blocking byte source.
    /// @details Memory use is bounded by JsonReaderOptions::maxBufferSize no matter
    /// how large the document is. Borrowed text in a returned event is valid until
    /// the next call on the reader.
    template<IO::ByteReader TReader>
    class JsonStreamReader
    {
    public:
        explicit JsonStreamReader(TReader& reader, const JsonReaderOptions& options = {})
            : m_reader(reader), m_tokenizer(options), m_buffer(options)
        {
        }

        [[nodiscard]] JsonExpected<JsonEvent> ReadNextEvent()
        {
            return detail::ReadNextEvent(m_tokenizer, m_buffer, [this](std::span<Byte> target) {
                return m_reader.Read(target);
            });
        }

        /// @brief Consume the next value and return a copy of its exact source text.
        /// @details Same positions as JsonBufferReader::ReadNextValueRaw. The whole
        /// value has to fit in JsonReaderOptions::maxBufferSize.
        [[nodiscard]] JsonExpected<std::optional<std::string>> ReadNextValueRaw()
        {
            if (!m_tokenizer.IsExpectingValue())
                return std::unexpected(detail::MakeInvalidRawReadError());

            m_buffer.Pin();
            const UIntSize pinOffset = m_tokenizer.Location().offset;
            auto           first     = ReadNextEvent();
            if (!first)
            {
                m_buffer.Unpin();
                return std::unexpected(std::move(first.error()));
            }
            if (first->IsEndArray())
            {
                m_buffer.Unpin();
                return std::optional<std::string> {};
            }

            const UIntSize valueStart = m_tokenizer.LastTokenOffset() - pinOffset;
            UIntSize       depth      = first->IsContainerStart() ? 1 : 0;
            while (depth > 0)
            {
                auto event = ReadNextEvent();
                if (!event)
                {
                    m_buffer.Unpin();
                    return std::unexpected(std::move(event.error()));
                }
                if (event->IsContainerStart())
                    ++depth;
                else if (event->IsContainerEnd())
                    --depth;
            }

            std::string raw {m_buffer.PinnedText().substr(valueStart)};
            m_buffer.Unpin();
            return std::optional<std::string> {std::move(raw)};
        }

        [[nodiscard]] ParseLocation Location() const noexcept { return m_tokenizer.Location(); }

    private:
        TReader&                m_reader;
        JsonTokenizer           m_tokenizer;
        detail::JsonInputBuffer m_buffer;
    };

    /// @brief Reads events from a non-blocking byte source.
    /// @details When the source has no bytes ready, ReadNextEvent fails with a
    /// transport error for which JsonError::IsWouldBlock() is true. Nothing is lost:
    /// buffered bytes and tokenizer state are kept, and calling ReadNextEvent again
    /// once the source is readable continues the same token. Events are only
    /// returned complete.
    template<IO::NonBlockingByteReader TReader>
    class JsonNonBlockingReader
    {
    public:
        explicit JsonNonBlockingReader(TReader& reader, const JsonReaderOptions& options = {})
            : m_reader(reader), m_tokenizer(options), m_buffer(options)
        {
        }

        [[nodiscard]] JsonExpected<JsonEvent> ReadNextEvent()
        {
            return detail::ReadNextEvent(m_tokenizer, m_buffer, [this](std::span<Byte> target) {
                return m_reader.TryRead(target);
            });
        }

        [[nodiscard]] ParseLocation Location() const noexcept { return m_tokenizer.Location(); }

    private:
        TReader&                m_reader;
        JsonTokenizer           m_tokenizer;
        detail::JsonInputBuffer m_buffer;
    };
}// namespace JEVT::Serialization
