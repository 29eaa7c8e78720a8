#include <JEVT/Serialization/JSON/Detail/JsonInputBuffer.hpp>

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

namespace JEVT::Serialization::detail
{
    JsonInputBuffer::JsonInputBuffer(const JsonReaderOptions& options)
        : m_options(options)
    {
        if (m_options.minReadSize == 0)
            m_options.minReadSize = 1;
        if (m_options.maxBufferSize < m_options.minReadSize)
            m_options.maxBufferSize = m_options.minReadSize;
    }

    IO::IOExpected<std::span<Byte>> JsonInputBuffer::PrepareWrite()
    {
        const UIntSize keepFrom = m_pinned ? m_pin : m_start;
        if (keepFrom > 0)
        {
            const UIntSize kept = m_end - keepFrom;
            if (kept > 0)
                std::memmove(m_data.data(), m_data.data() + keepFrom, kept);
            m_start -= keepFrom;
            m_end = kept;
            if (m_pinned)
                m_pin = 0;
        }

        const UIntSize free = m_data.Size() - m_end;
        if (free < m_options.minReadSize)
        {
            if (m_end >= m_options.maxBufferSize)
            {
                return std::unexpected(IO::MakeIOError(IO::IOErrorCode::BufferFull,
                                                       "JSON token does not fit in the maximum buffer size of " +
                                                               std::to_string(m_options.maxBufferSize) + " bytes"));
            }
            UIntSize newSize = m_data.Size() * 2;
            if (newSize < m_end + m_options.minReadSize)
                newSize = m_end + m_options.minReadSize;
            if (newSize > m_options.maxBufferSize)
                newSize = m_options.maxBufferSize;
            try
            {
                m_data.Resize(newSize);
            } catch (const std::bad_alloc&)
            {
                return std::unexpected(IO::MakeIOError(IO::IOErrorCode::BufferFull, "out of memory while growing the JSON input buffer"));
            }
        }
        return std::span<Byte> {m_data.data() + m_end, m_data.Size() - m_end};
    }

    void JsonInputBuffer::Commit(UIntSize count) noexcept
    {
        if (count == 0)
        {
            m_ending = true;
            return;
        }
        m_end += count;
    }

    void JsonInputBuffer::Pin() noexcept
    {
        m_pin    = m_start;
        m_pinned = true;
    }

    void JsonInputBuffer::Unpin() noexcept
    {
        m_pinned = false;
    }

    std::string_view JsonInputBuffer::PinnedText() const noexcept
    {
        if (!m_pinned)
            return {};
        return {reinterpret_cast<const char*>(m_data.data()) + m_pin, m_start - m_pin};
    }
}// namespace JEVT::Serialization::detail
