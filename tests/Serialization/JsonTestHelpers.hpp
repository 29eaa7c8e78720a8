/// @file JsonTestHelpers.hpp
/// @brief Shared fixtures for the JSON reader and writer tests.
#pragma once

#include <JEVT/IO/IOError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonReader.hpp>
#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>

#include <catch2/catch_tostring.hpp>

#include <algorithm>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Catch
{
    template<>
    struct StringMaker<JEVT::Serialization::JsonEvent>
    {
        static std::string convert(const JEVT::Serialization::JsonEvent& event)
        {
            return JEVT::Serialization::ToString(event);
        }
    };
}// namespace Catch

namespace JEVT::Tests
{
    using Serialization::JsonEvent;

    /// Read a whole document with JsonBufferReader, keeping owned copies of the events (Eof included).
    inline std::expected<std::vector<JsonEvent>, Serialization::ParseError> ParseAll(std::string_view input)
    {
        Serialization::JsonBufferReader reader {input};
        std::vector<JsonEvent>          events;
        while (true)
        {
            auto event = reader.ReadNextEvent();
            if (!event)
                return std::unexpected(event.error());
            events.push_back(event->ToOwned());
            if (event->IsEof())
                return events;
        }
    }

    /// Drive a JsonTokenizer directly, presenting the input as the given consecutive windows.
    inline std::expected<std::vector<JsonEvent>, Serialization::ParseError> TokenizeInChunks(std::string_view input,
                                                                                              std::span<const std::size_t> chunkSizes)
    {
        Serialization::JsonTokenizer tokenizer;
        std::vector<JsonEvent>       events;
        std::string                  window;
        std::size_t                  delivered = 0;
        std::size_t                  chunk     = 0;
        while (true)
        {
            const bool isEnding = delivered >= input.size();
            auto       result   = tokenizer.Next(std::string_view {window}, isEnding);
            if (result.event)
            {
                if (!*result.event)
                    return std::unexpected(result.event->error());
                events.push_back((*result.event)->ToOwned());
                window.erase(0, result.consumedBytes);
                if (events.back().IsEof())
                    return events;
                continue;
            }
            window.erase(0, result.consumedBytes);
            const std::size_t size = chunk < chunkSizes.size() ? chunkSizes[chunk++] : input.size();
            const std::size_t take = std::min(size, input.size() - delivered);
            window.append(input.substr(delivered, take));
            delivered += take;
        }
    }

    /// Blocking source handing out at most `chunk` bytes per Read.
    class ChunkedReader
    {
    public:
        ChunkedReader(std::string_view data, std::size_t chunk)
            : m_data(data), m_chunk(chunk)
        {
        }

        IO::IOExpected<UIntSize> Read(std::span<Byte> destination)
        {
            const std::size_t count = std::min({m_chunk, destination.size(), m_data.size() - m_offset});
            std::memcpy(destination.data(), m_data.data() + m_offset, count);
            m_offset += count;
            ++m_reads;
            return count;
        }

        [[nodiscard]] std::size_t Reads() const noexcept { return m_reads; }

    private:
        std::string_view m_data;
        std::size_t      m_chunk;
        std::size_t      m_offset {0};
        std::size_t      m_reads {0};
    };

    /// Non-blocking source that delivers scripted pieces and reports WouldBlock before each one.
    class ScriptedReader
    {
    public:
        explicit ScriptedReader(std::vector<std::string> pieces)
            : m_pieces(std::move(pieces))
        {
        }

        IO::IOExpected<UIntSize> TryRead(std::span<Byte> destination)
        {
            if (m_index >= m_pieces.size())
                return UIntSize {0};
            if (!m_ready)
            {
                m_ready = true;
                ++m_wouldBlockCount;
                return std::unexpected(IO::MakeIOError(IO::IOErrorCode::WouldBlock, "scripted pause"));
            }
            const std::string& piece = m_pieces[m_index];
            const std::size_t  count = std::min(destination.size(), piece.size() - m_offset);
            std::memcpy(destination.data(), piece.data() + m_offset, count);
            m_offset += count;
            if (m_offset == piece.size())
            {
                ++m_index;
                m_offset = 0;
                m_ready  = false;
            }
            return count;
        }

        [[nodiscard]] std::size_t WouldBlockCount() const noexcept { return m_wouldBlockCount; }

    private:
        std::vector<std::string> m_pieces;
        std::size_t              m_index {0};
        std::size_t              m_offset {0};
        std::size_t              m_wouldBlockCount {0};
        bool                     m_ready {false};
    };

    /// Non-blocking sink accepting at most `budget` bytes between calls to Refill.
    class ThrottledWriter
    {
    public:
        explicit ThrottledWriter(std::size_t budget)
            : m_budget(budget)
        {
        }

        IO::IOExpected<UIntSize> TryWrite(std::span<const Byte> source)
        {
            if (m_budget == 0)
                return std::unexpected(IO::MakeIOError(IO::IOErrorCode::WouldBlock, "throttled"));
            const std::size_t count = std::min(m_budget, source.size());
            m_output.append(reinterpret_cast<const char*>(source.data()), count);
            m_budget -= count;
            return count;
        }

        void Refill(std::size_t budget) noexcept { m_budget = budget; }

        [[nodiscard]] const std::string& Output() const noexcept { return m_output; }

    private:
        std::size_t m_budget;
        std::string m_output;
    };
}// namespace JEVT::Tests
