/// @file ByteConcepts.hpp
/// @brief Static capability concepts for byte sources and sinks.
/// @details
/// The JSON readers and writers are templates over these concepts so that a
/// transport is bound at compile time and the lexing loop never goes through a
/// virtual call. Blocking and non-blocking transports are distinct concepts:
/// a non-blocking transport reports IOErrorCode::WouldBlock instead of waiting.
#pragma once

#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>

#include <concepts>
#include <span>

namespace JEVT::IO
{
    /// @brief Blocking source. Read returns the number of bytes stored; 0 means end of input.
    template<class R>
    concept ByteReader =
            requires(R& reader, std::span<Byte> destination) {
                { reader.Read(destination) } -> std::same_as<IOExpected<UIntSize>>;
            };

    /// @brief Non-blocking source. TryRead fails with WouldBlock when no byte is ready; 0 means end of input.
    template<class R>
    concept NonBlockingByteReader =
            requires(R& reader, std::span<Byte> destination) {
                { reader.TryRead(destination) } -> std::same_as<IOExpected<UIntSize>>;
            };

    /// @brief Blocking sink. Write may accept fewer bytes than offered.
    template<class W>
    concept ByteWriter =
            requires(W& writer, std::span<const Byte> source) {
                { writer.Write(source) } -> std::same_as<IOExpected<UIntSize>>;
                { writer.Flush() } -> std::same_as<IOExpected<void>>;
            };

    /// @brief Non-blocking sink. TryWrite fails with WouldBlock when the sink cannot take bytes now.
    template<class W>
    concept NonBlockingByteWriter =
            requires(W& writer, std::span<const Byte> source) {
                { writer.TryWrite(source) } -> std::same_as<IOExpected<UIntSize>>;
            };
}// namespace JEVT::IO
