/// @file JsonLexical.hpp
/// @brief Pure lexical routines shared by the JSON tokenizer and the event writer.
/// @details
/// Every scanner looks at a window that starts at the first byte of a token and
/// reports one of three outcomes: the token is complete (`length` bytes), the window
/// ends before the token can be judged and more input is needed, or the token is
/// malformed (`length` is then the offset of the offending byte within the window).
/// When `isEnding` is true no bytes follow the window, so a scanner never asks for
/// more input.
#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/Core/ParseError.hpp>

#include <string>
#include <string_view>

namespace JEVT::Serialization::JsonLexical
{
    enum class LexStatus : UInt8
    {
        Ok,
        NeedMoreInput,
        Invalid,
    };

    struct LexResult
    {
        LexStatus      status {LexStatus::Ok};
        UIntSize       length {0};
        ParseErrorCode code {ParseErrorCode::None};
        const char*    message {nullptr};

        [[nodiscard]] static constexpr LexResult Ok(UIntSize length) noexcept
        {
            return LexResult {LexStatus::Ok, length, ParseErrorCode::None, nullptr};
        }
        [[nodiscard]] static constexpr LexResult NeedMore() noexcept
        {
            return LexResult {LexStatus::NeedMoreInput, 0, ParseErrorCode::None, nullptr};
        }
        [[nodiscard]] static constexpr LexResult Invalid(UIntSize offset, ParseErrorCode code, const char* message) noexcept
        {
            return LexResult {LexStatus::Invalid, offset, code, message};
        }

        [[nodiscard]] constexpr bool IsOk() const noexcept { return status == LexStatus::Ok; }
        [[nodiscard]] constexpr bool IsInvalid() const noexcept { return status == LexStatus::Invalid; }
        [[nodiscard]] constexpr bool NeedsMoreInput() const noexcept { return status == LexStatus::NeedMoreInput; }
    };

    /// @brief Resumable progress of a string scan.
    /// @details `scanned` is the offset of the first byte not yet validated, so a
    /// scan that ran out of input continues where it stopped once the same token
    /// is presented again with more bytes behind it.
    struct StringScanState
    {
        UIntSize scanned {1};
        bool     hasEscapes {false};
    };

    [[nodiscard]] constexpr bool IsWhitespace(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    [[nodiscard]] constexpr bool IsDigit(char c) noexcept
    {
        return c >= '0' && c <= '9';
    }

    /// @brief Validate a number literal starting at input[0] ('-' or a digit).
    [[nodiscard]] JEVT_API LexResult ScanNumber(std::string_view input, bool isEnding) noexcept;

    /// @brief Match @p keyword (true, false, null) at the start of @p input.
    [[nodiscard]] JEVT_API LexResult ScanLiteral(std::string_view input, std::string_view keyword, bool isEnding) noexcept;

    /// @brief Decode one escape sequence starting at the backslash in input[0].
    /// @details A high surrogate must be followed by a `\u` escape holding a low
    /// surrogate; the pair is combined into one scalar and the length covers both.
    [[nodiscard]] JEVT_API LexResult ScanEscape(std::string_view input, bool isEnding, Char32& scalar) noexcept;

    /// @brief Validate one UTF-8 encoded scalar whose lead byte is input[0] (>= 0x80).
    [[nodiscard]] JEVT_API LexResult ScanUtf8Sequence(std::string_view input, bool isEnding) noexcept;

    /// @brief Validate a string literal starting at the opening quote; the length includes both quotes.
    [[nodiscard]] JEVT_API LexResult ScanString(std::string_view input, bool isEnding, StringScanState& state) noexcept;

    [[nodiscard]] inline LexResult ScanString(std::string_view input, bool isEnding) noexcept
    {
        StringScanState state;
        return ScanString(input, isEnding, state);
    }

    /// @brief Decode the escapes of a string body (the bytes between the quotes) into @p out.
    /// @return false if the body holds a malformed escape.
    [[nodiscard]] JEVT_API bool DecodeString(std::string_view body, std::string& out);

    /// @brief Write the UTF-8 encoding of @p scalar to @p out (room for 4 bytes) and return its length.
    JEVT_API UIntSize EncodeUtf8(Char32 scalar, char* out) noexcept;

    /// @brief Append @p text with JSON escaping applied, without quotes.
    /// @details `"` and `\` are escaped, as are control characters: short forms for
    /// \b \f \n \r \t and `\u00xx` with lowercase hex for the rest. All other bytes are copied unchanged.
    JEVT_API void AppendEscaped(std::string_view text, std::string& out);

    /// @brief Append @p text as a quoted, escaped JSON string.
    JEVT_API void AppendQuoted(std::string_view text, std::string& out);
}// namespace JEVT::Serialization::JsonLexical
