// Fundamental type definitions shared by every JEVT module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace JEVT
{
    using UInt32 = std::uint32_t;
    using UInt8  = std::uint8_t;
    using Int32  = std::int32_t;

    /// @brief Raw byte exchanged with byte sources and sinks.
    using Byte = std::byte;

    using UIntSize = std::size_t;

    /// @brief Unicode scalar value decoded from a `\u` escape.
    using Char32 = char32_t;
}// namespace JEVT
