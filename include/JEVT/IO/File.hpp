#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>

#include <span>
#include <string>

namespace JEVT::IO
{
    /// @brief Low-level file handle wrapper using platform APIs.
    /// @details Satisfies ByteReader and ByteWriter through Read/Write/Flush, and
    /// NonBlockingByteReader and NonBlockingByteWriter through TryRead/TryWrite once
    /// the descriptor is switched to non-blocking mode (POSIX only).
    class JEVT_API File
    {
    public:
#if defined(_WIN32)
        using NativeHandle = void*;
#else
        using NativeHandle = int;
#endif

        enum class OpenMode : UInt8
        {
            Read,
            Write,
            ReadWrite,
        };

        File() noexcept = default;
        /// @brief Take ownership of an already open native handle (for example a pipe end or stdin).
        explicit File(NativeHandle handle) noexcept;
        File(const File&)            = delete;
        File& operator=(const File&) = delete;
        File(File&& other) noexcept;
        File& operator=(File&& other) noexcept;
        ~File();

        IOExpected<void> Open(const std::string& path, OpenMode mode) noexcept;
        void             Close() noexcept;

        [[nodiscard]] bool         IsOpen() const noexcept;
        [[nodiscard]] NativeHandle Handle() const noexcept { return m_handle; }

        /// @brief Give up ownership without closing.
        NativeHandle Release() noexcept;

        IOExpected<UIntSize> Read(std::span<Byte> destination) noexcept;
        IOExpected<UIntSize> Write(std::span<const Byte> source) noexcept;
        IOExpected<void>     Flush() noexcept;

        /// @brief Switch the descriptor between blocking and non-blocking mode.
        IOExpected<void> SetNonBlocking(bool enabled) noexcept;

        /// @brief Like Read, but EAGAIN/EWOULDBLOCK is reported as IOErrorCode::WouldBlock.
        IOExpected<UIntSize> TryRead(std::span<Byte> destination) noexcept;
        /// @brief Like Write, but EAGAIN/EWOULDBLOCK is reported as IOErrorCode::WouldBlock.
        IOExpected<UIntSize> TryWrite(std::span<const Byte> source) noexcept;

    private:
#if defined(_WIN32)
        void* m_handle {nullptr};
#else
        int m_handle {-1};
#endif
    };
}// namespace JEVT::IO
