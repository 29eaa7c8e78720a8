#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/IByteReader.hpp>
#include <JEVT/IO/IOError.hpp>

#include <cstring>
#include <string_view>

namespace JEVT::IO
{
    /// @brief In-memory implementation of IByteReader.
    /// @details Also offers TryRead, which never blocks, so the same buffer can
    /// drive a JsonNonBlockingReader.
    class JEVT_API MemoryReader final : public IByteReader
    {
    public:
        explicit MemoryReader(std::span<const Byte> data) noexcept
            : m_data(data.data()), m_size(data.size())
        {
        }

        explicit MemoryReader(std::string_view text) noexcept
            : m_data(reinterpret_cast<const Byte*>(text.data())), m_size(text.size())
        {
        }

        IOExpected<UIntSize> Read(std::span<Byte> destination) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toRead    = (destination.size() < remaining) ? destination.size() : remaining;
            if (toRead == 0)
                return UIntSize {0};
            std::memcpy(destination.data(), m_data + m_offset, toRead);
            m_offset += toRead;
            return toRead;
        }

        IOExpected<UIntSize> TryRead(std::span<Byte> destination) noexcept
        {
            return Read(destination);
        }

        IOExpected<UIntSize> Skip(UIntSize bytes) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toSkip    = (bytes < remaining) ? bytes : remaining;
            m_offset += toSkip;
            return toSkip;
        }

        IOExpected<UIntSize> Tell() const noexcept override
        {
            return m_offset;
        }

        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            return (m_offset < m_size) ? (m_size - m_offset) : 0;
        }

    private:
        const Byte* m_data {nullptr};
        UIntSize    m_size {0};
        UIntSize    m_offset {0};
    };
}// namespace JEVT::IO
