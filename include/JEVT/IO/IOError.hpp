#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace JEVT::IO
{
    /// @brief Error codes for low-level IO operations.
    enum class IOErrorCode : UInt8
    {
        None,
        EndOfStream,
        InvalidArgument,
        SystemError,
        NotSupported,
        /// Non-blocking transport has nothing to offer right now; retry later.
        WouldBlock,
        /// A bounded buffer or sink cannot take more bytes.
        BufferFull,
    };

    /// @brief IO error payload with optional system code.
    struct IOError
    {
        IOErrorCode code {IOErrorCode::None};
        Int32       systemCode {0};
        std::string message {};

        [[nodiscard]] bool IsWouldBlock() const noexcept
        {
            return code == IOErrorCode::WouldBlock;
        }
    };

    template<typename T>
    using IOExpected = std::expected<T, IOError>;

    [[nodiscard]] inline IOError MakeIOError(IOErrorCode code, std::string message, Int32 systemCode = 0)
    {
        IOError err;
        err.code       = code;
        err.systemCode = systemCode;
        err.message    = std::move(message);
        return err;
    }

    [[nodiscard]] constexpr std::string_view ToString(IOErrorCode code) noexcept
    {
        switch (code)
        {
            case IOErrorCode::None: return "None";
            case IOErrorCode::EndOfStream: return "EndOfStream";
            case IOErrorCode::InvalidArgument: return "InvalidArgument";
            case IOErrorCode::SystemError: return "SystemError";
            case IOErrorCode::NotSupported: return "NotSupported";
            case IOErrorCode::WouldBlock: return "WouldBlock";
            case IOErrorCode::BufferFull: return "BufferFull";
        }
        return "Unknown";
    }
}// namespace JEVT::IO
