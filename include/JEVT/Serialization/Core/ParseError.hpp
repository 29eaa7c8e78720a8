#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace JEVT::Serialization
{
    /// @brief Classification of syntax errors.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidNumber,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        InvalidUtf8,
        ControlCharacter,
        DepthExceeded,
        TrailingCharacters,
        TrailingComma,
        MismatchedContainer,
        KeyExpected,
    };

    /// @brief Byte offset (0-based) and line/column (1-based) position for parse errors.
    /// @details Columns count bytes, not characters.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {0};
        UIntSize column {0};

        [[nodiscard]] static constexpr ParseLocation Unknown() noexcept
        {
            return ParseLocation {};
        }

        [[nodiscard]] static constexpr ParseLocation Start() noexcept
        {
            return ParseLocation {0, 1, 1};
        }

        [[nodiscard]] constexpr bool IsKnown() const noexcept
        {
            return line != 0;
        }

        friend constexpr bool operator==(const ParseLocation&, const ParseLocation&) = default;
    };

    /// @brief Parsing error payload with code, location, and message.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        ParseLocation  location {};
        std::string    message {};

        /// @brief "Parser error at line L column C: message", or just the message when the location is unknown.
        [[nodiscard]] JEVT_API std::string ToString() const;
    };

    [[nodiscard]] JEVT_API std::string_view ToString(ParseErrorCode code) noexcept;

    template<typename T>
    using ParseExpected = std::expected<T, ParseError>;
}// namespace JEVT::Serialization
