#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>

#include <span>

namespace JEVT::IO
{
    /// @brief Minimal byte reader interface for streaming inputs.
    /// @details Satisfies the ByteReader concept, so a JsonStreamReader can be
    /// instantiated over IByteReader when the transport is only known at runtime.
    class JEVT_API IByteReader
    {
    public:
        virtual ~IByteReader() = default;

        /// @brief Read up to destination.size() bytes into destination.
        virtual IOExpected<UIntSize> Read(std::span<Byte> destination) noexcept = 0;

        /// @brief Skip forward by up to @p bytes.
        virtual IOExpected<UIntSize> Skip(UIntSize bytes) noexcept = 0;

        /// @brief Current stream position if known.
        virtual IOExpected<UIntSize> Tell() const noexcept = 0;
    };
}// namespace JEVT::IO
