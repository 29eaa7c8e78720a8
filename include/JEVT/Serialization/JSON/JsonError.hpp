/// @file JsonError.hpp
/// @brief Error types reported by the JSON readers and writers.
#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/IO/IOError.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/Core/ParseError.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace JEVT::Serialization
{
    /// @brief Ways a caller can misuse the event writer.
    enum class JsonUsageErrorCode : UInt8
    {
        None,
        /// The event is not allowed at the current position (a key outside an object, a value where a key is expected).
        UnexpectedEvent,
        /// EndArray/EndObject does not match the innermost open container.
        MismatchedContainer,
        /// A second root value, or any event after Eof.
        DocumentComplete,
        /// Eof or Finish on a document with open containers or no root value.
        DocumentIncomplete,
        /// A reader operation was called where it cannot apply.
        InvalidState,
    };

    struct JsonUsageError
    {
        JsonUsageErrorCode code {JsonUsageErrorCode::None};
        std::string        message {};
    };

    enum class JsonErrorKind : UInt8
    {
        Syntax,
        Usage,
        Transport,
    };

    /// @brief Error of a reader or writer adapter: malformed input, caller misuse, or a byte source/sink failure.
    /// @details Only the member matching `kind` is meaningful. A transport error with
    /// IOErrorCode::WouldBlock is not terminal: the adapter kept its state and the
    /// call can be repeated once the transport is ready.
    struct JsonError
    {
        JsonErrorKind  kind {JsonErrorKind::Syntax};
        ParseError     syntax {};
        JsonUsageError usage {};
        IO::IOError    transport {};

        [[nodiscard]] static JsonError FromSyntax(ParseError error)
        {
            JsonError result;
            result.kind   = JsonErrorKind::Syntax;
            result.syntax = std::move(error);
            return result;
        }

        [[nodiscard]] static JsonError FromUsage(JsonUsageError error)
        {
            JsonError result;
            result.kind  = JsonErrorKind::Usage;
            result.usage = std::move(error);
            return result;
        }

        [[nodiscard]] static JsonError FromTransport(IO::IOError error)
        {
            JsonError result;
            result.kind      = JsonErrorKind::Transport;
            result.transport = std::move(error);
            return result;
        }

        [[nodiscard]] bool IsSyntax() const noexcept { return kind == JsonErrorKind::Syntax; }
        [[nodiscard]] bool IsUsage() const noexcept { return kind == JsonErrorKind::Usage; }
        [[nodiscard]] bool IsTransport() const noexcept { return kind == JsonErrorKind::Transport; }
        [[nodiscard]] bool IsWouldBlock() const noexcept { return IsTransport() && transport.IsWouldBlock(); }

        [[nodiscard]] JEVT_API std::string ToString() const;
    };

    [[nodiscard]] JEVT_API std::string_view ToString(JsonUsageErrorCode code) noexcept;

    template<typename T>
    using JsonExpected = std::expected<T, JsonError>;
}// namespace JEVT::Serialization
