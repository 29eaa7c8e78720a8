#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>

#include <cstring>
#include <span>
#include <string_view>

namespace JEVT::IO
{
    /// @brief Byte sink writing into a caller-owned fixed-size span.
    /// @details Write stores as much as fits; once the span is full, further
    /// writes fail with IOErrorCode::BufferFull.
    class JEVT_API MemoryWriter final
    {
    public:
        explicit MemoryWriter(std::span<Byte> storage) noexcept
            : m_data(storage.data()), m_capacity(storage.size())
        {
        }

        IOExpected<UIntSize> Write(std::span<const Byte> source) noexcept
        {
            if (source.empty())
                return UIntSize {0};
            const UIntSize free = m_capacity - m_size;
            if (free == 0)
                return std::unexpected(MakeIOError(IOErrorCode::BufferFull, "memory writer is full"));
            const UIntSize toWrite = source.size() < free ? source.size() : free;
            std::memcpy(m_data + m_size, source.data(), toWrite);
            m_size += toWrite;
            return toWrite;
        }

        IOExpected<UIntSize> TryWrite(std::span<const Byte> source) noexcept
        {
            return Write(source);
        }

        IOExpected<void> Flush() noexcept
        {
            return {};
        }

        [[nodiscard]] std::span<const Byte> Written() const noexcept
        {
            return {m_data, m_size};
        }

        [[nodiscard]] std::string_view WrittenText() const noexcept
        {
            return {reinterpret_cast<const char*>(m_data), m_size};
        }

        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            return m_capacity - m_size;
        }

    private:
        Byte*    m_data {nullptr};
        UIntSize m_capacity {0};
        UIntSize m_size {0};
    };
}// namespace JEVT::IO
