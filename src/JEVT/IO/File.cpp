#include <JEVT/IO/File.hpp>

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace JEVT::IO
{
    namespace
    {
        [[nodiscard]] IOError MakeSystemError(const char* message, int code)
        {
            return MakeIOError(IOErrorCode::SystemError, message ? message : "system error", code);
        }

        [[nodiscard]] IOError MakeNotOpenError()
        {
            return MakeIOError(IOErrorCode::InvalidArgument, "file not open");
        }

#if !defined(_WIN32)
        [[nodiscard]] bool IsWouldBlockErrno(int code) noexcept
        {
#if defined(EAGAIN) && EAGAIN != EWOULDBLOCK
            if (code == EAGAIN)
                return true;
#endif
            return code == EWOULDBLOCK;
        }
#endif
    }// namespace

    File::File(NativeHandle handle) noexcept
        : m_handle(handle)
    {
    }

    File::File(File&& other) noexcept
    {
        *this = std::move(other);
    }

    File& File::operator=(File&& other) noexcept
    {
        if (this != &other)
        {
            Close();
            m_handle = other.Release();
        }
        return *this;
    }

    File::~File()
    {
        Close();
    }

    IOExpected<void> File::Open(const std::string& path, OpenMode mode) noexcept
    {
        Close();
#if defined(_WIN32)
        DWORD access   = 0;
        DWORD creation = OPEN_EXISTING;
        switch (mode)
        {
            case OpenMode::Read:
                access   = GENERIC_READ;
                creation = OPEN_EXISTING;
                break;
            case OpenMode::Write:
                access   = GENERIC_WRITE;
                creation = CREATE_ALWAYS;
                break;
            case OpenMode::ReadWrite:
                access   = GENERIC_READ | GENERIC_WRITE;
                creation = OPEN_ALWAYS;
                break;
        }
        HANDLE handle = CreateFileA(path.c_str(), access, FILE_SHARE_READ, nullptr, creation, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle == INVALID_HANDLE_VALUE)
            return std::unexpected(MakeSystemError("CreateFileA failed", static_cast<int>(GetLastError())));
        m_handle = handle;
#else
        int flags = 0;
        switch (mode)
        {
            case OpenMode::Read:
                flags = O_RDONLY;
                break;
            case OpenMode::Write:
                flags = O_WRONLY | O_CREAT | O_TRUNC;
                break;
            case OpenMode::ReadWrite:
                flags = O_RDWR | O_CREAT;
                break;
        }
        const int fd = ::open(path.c_str(), flags, 0644);
        if (fd < 0)
            return std::unexpected(MakeSystemError("open failed", errno));
        m_handle = fd;
#endif
        return {};
    }

    void File::Close() noexcept
    {
#if defined(_WIN32)
        if (m_handle)
        {
            CloseHandle(static_cast<HANDLE>(m_handle));
            m_handle = nullptr;
        }
#else
        if (m_handle >= 0)
        {
            ::close(m_handle);
            m_handle = -1;
        }
#endif
    }

    bool File::IsOpen() const noexcept
    {
#if defined(_WIN32)
        return m_handle != nullptr;
#else
        return m_handle >= 0;
#endif
    }

    File::NativeHandle File::Release() noexcept
    {
        const NativeHandle handle = m_handle;
#if defined(_WIN32)
        m_handle = nullptr;
#else
        m_handle = -1;
#endif
        return handle;
    }

    IOExpected<UIntSize> File::Read(std::span<Byte> destination) noexcept
    {
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
        if (destination.empty())
            return UIntSize {0};
#if defined(_WIN32)
        DWORD bytesRead = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), destination.data(), static_cast<DWORD>(destination.size()), &bytesRead, nullptr))
        {
            const DWORD code = GetLastError();
            if (code == ERROR_BROKEN_PIPE)
                return UIntSize {0};
            return std::unexpected(MakeSystemError("ReadFile failed", static_cast<int>(code)));
        }
        return static_cast<UIntSize>(bytesRead);
#else
        while (true)
        {
            const ssize_t result = ::read(m_handle, destination.data(), destination.size());
            if (result >= 0)
                return static_cast<UIntSize>(result);
            if (errno != EINTR)
                return std::unexpected(MakeSystemError("read failed", errno));
        }
#endif
    }

    IOExpected<UIntSize> File::Write(std::span<const Byte> source) noexcept
    {
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
        if (source.empty())
            return UIntSize {0};
#if defined(_WIN32)
        DWORD bytesWritten = 0;
        if (!WriteFile(static_cast<HANDLE>(m_handle), source.data(), static_cast<DWORD>(source.size()), &bytesWritten, nullptr))
            return std::unexpected(MakeSystemError("WriteFile failed", static_cast<int>(GetLastError())));
        return static_cast<UIntSize>(bytesWritten);
#else
        while (true)
        {
            const ssize_t result = ::write(m_handle, source.data(), source.size());
            if (result >= 0)
                return static_cast<UIntSize>(result);
            if (errno != EINTR)
                return std::unexpected(MakeSystemError("write failed", errno));
        }
#endif
    }

    IOExpected<void> File::Flush() noexcept
    {
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
#if defined(_WIN32)
        if (GetFileType(static_cast<HANDLE>(m_handle)) == FILE_TYPE_DISK && !FlushFileBuffers(static_cast<HANDLE>(m_handle)))
            return std::unexpected(MakeSystemError("FlushFileBuffers failed", static_cast<int>(GetLastError())));
#endif
        // POSIX writes go straight to the descriptor; nothing is buffered here.
        return {};
    }

    IOExpected<void> File::SetNonBlocking(bool enabled) noexcept
    {
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
#if defined(_WIN32)
        (void) enabled;
        return std::unexpected(MakeIOError(IOErrorCode::NotSupported, "non-blocking file handles are not supported on Windows"));
#else
        const int flags = ::fcntl(m_handle, F_GETFL, 0);
        if (flags < 0)
            return std::unexpected(MakeSystemError("fcntl(F_GETFL) failed", errno));
        const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
        if (::fcntl(m_handle, F_SETFL, updated) < 0)
            return std::unexpected(MakeSystemError("fcntl(F_SETFL) failed", errno));
        return {};
#endif
    }

    IOExpected<UIntSize> File::TryRead(std::span<Byte> destination) noexcept
    {
#if defined(_WIN32)
        return Read(destination);
#else
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
        if (destination.empty())
            return UIntSize {0};
        while (true)
        {
            const ssize_t result = ::read(m_handle, destination.data(), destination.size());
            if (result >= 0)
                return static_cast<UIntSize>(result);
            const int code = errno;
            if (code == EINTR)
                continue;
            if (IsWouldBlockErrno(code))
                return std::unexpected(MakeIOError(IOErrorCode::WouldBlock, "no data available", code));
            return std::unexpected(MakeSystemError("read failed", code));
        }
#endif
    }

    IOExpected<UIntSize> File::TryWrite(std::span<const Byte> source) noexcept
    {
#if defined(_WIN32)
        return Write(source);
#else
        if (!IsOpen())
            return std::unexpected(MakeNotOpenError());
        if (source.empty())
            return UIntSize {0};
        while (true)
        {
            const ssize_t result = ::write(m_handle, source.data(), source.size());
            if (result >= 0)
                return static_cast<UIntSize>(result);
            const int code = errno;
            if (code == EINTR)
                continue;
            if (IsWouldBlockErrno(code))
                return std::unexpected(MakeIOError(IOErrorCode::WouldBlock, "sink is full", code));
            return std::unexpected(MakeSystemError("write failed", code));
        }
#endif
    }
}// namespace JEVT::IO
