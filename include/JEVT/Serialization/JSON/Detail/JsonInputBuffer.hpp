/// @file JsonInputBuffer.hpp
/// @brief Byte window shared by the stream readers.
#pragma once

#include <JEVT/Containers/Vector.hpp>
#include <JEVT/Defines.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>

#include <span>
#include <string_view>

namespace JEVT::Serialization::detail
{
    /// @brief Growable window over the unconsumed part of a byte stream.
    /// @details
    /// Bytes between Window().begin() and the end of valid data are kept contiguous:
    /// before a read, consumed bytes are dropped by moving the rest to the front, and
    /// the storage grows (up to JsonReaderOptions::maxBufferSize) only when the
    /// unconsumed bytes fill it. While pinned, bytes from the pin onward are kept as well.
    class JEVT_API JsonInputBuffer
    {
    public:
        explicit JsonInputBuffer(const JsonReaderOptions& options);

        [[nodiscard]] std::span<const Byte> Window() const noexcept
        {
            return {m_data.data() + m_start, m_end - m_start};
        }

        /// @brief True once the source reported end of input.
        [[nodiscard]] bool IsEnding() const noexcept { return m_ending; }

        void Consume(UIntSize count) noexcept { m_start += count; }

        /// @brief Writable space behind the valid bytes, at least minReadSize unless capped by maxBufferSize.
        /// @return IOErrorCode::BufferFull when the kept bytes already fill maxBufferSize.
        [[nodiscard]] IO::IOExpected<std::span<Byte>> PrepareWrite();

        /// @brief Record @p count bytes written into the span from PrepareWrite; 0 marks end of input.
        void Commit(UIntSize count) noexcept;

        void Pin() noexcept;
        void Unpin() noexcept;
        /// @brief Bytes consumed since Pin().
        [[nodiscard]] std::string_view PinnedText() const noexcept;

    private:
        JsonReaderOptions              m_options;
        JEVT::Containers::Vector<Byte> m_data {};
        UIntSize                       m_start {0};
        UIntSize                       m_end {0};
        UIntSize                       m_pin {0};
        bool                           m_pinned {false};
        bool                           m_ending {false};
    };
}// namespace JEVT::Serialization::detail
