#include <JEVT/Serialization/JSON/JsonLexical.hpp>

namespace JEVT::Serialization::JsonLexical
{
    namespace
    {
        [[nodiscard]] LexResult EndOrNeedMore(bool isEnding, UIntSize offset, const char* message) noexcept
        {
            if (!isEnding)
                return LexResult::NeedMore();
            return LexResult::Invalid(offset, ParseErrorCode::UnexpectedEnd, message);
        }

        [[nodiscard]] bool IsHexDigit(char c) noexcept
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        [[nodiscard]] UInt32 HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return static_cast<UInt32>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<UInt32>(c - 'a' + 10);
            return static_cast<UInt32>(c - 'A' + 10);
        }

        /// Four hex digits starting at input[start].
        [[nodiscard]] LexResult ScanHex4(std::string_view input, UIntSize start, bool isEnding, UInt32& out) noexcept
        {
            out = 0;
            for (UIntSize i = start; i < start + 4; ++i)
            {
                if (i >= input.size())
                    return EndOrNeedMore(isEnding, i, "Unexpected end of input in a \\u escape");
                const char c = input[i];
                if (!IsHexDigit(c))
                    return LexResult::Invalid(i, ParseErrorCode::InvalidUnicodeEscape, "Invalid hexadecimal digit in a \\u escape");
                out = (out << 4) | HexValue(c);
            }
            return LexResult::Ok(start + 4);
        }

        [[nodiscard]] constexpr bool IsHighSurrogate(UInt32 unit) noexcept
        {
            return unit >= 0xD800 && unit <= 0xDBFF;
        }

        [[nodiscard]] constexpr bool IsLowSurrogate(UInt32 unit) noexcept
        {
            return unit >= 0xDC00 && unit <= 0xDFFF;
        }

        [[nodiscard]] bool IsGluedToNumber(char c) noexcept
        {
            return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '.' || c == '+' || c == '-';
        }

        [[nodiscard]] bool IsGluedToLiteral(char c) noexcept
        {
            return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        constexpr char kHexDigits[] = "0123456789abcdef";
    }// namespace

    LexResult ScanNumber(std::string_view input, bool isEnding) noexcept
    {
        UIntSize i = 0;
        if (i < input.size() && input[i] == '-')
            ++i;

        // Integer part
        if (i >= input.size())
            return EndOrNeedMore(isEnding, i, "Unexpected end of input in a number");
        if (input[i] == '0')
        {
            ++i;
            if (i < input.size() && IsDigit(input[i]))
                return LexResult::Invalid(i, ParseErrorCode::InvalidNumber, "Leading zeros are not allowed in numbers");
        }
        else if (input[i] >= '1' && input[i] <= '9')
        {
            while (i < input.size() && IsDigit(input[i]))
                ++i;
        }
        else
        {
            return LexResult::Invalid(i, ParseErrorCode::InvalidNumber, "A digit was expected");
        }

        if (i >= input.size())
            return isEnding ? LexResult::Ok(i) : LexResult::NeedMore();

        // Fraction
        if (input[i] == '.')
        {
            ++i;
            if (i >= input.size())
                return EndOrNeedMore(isEnding, i, "Unexpected end of input, a digit was expected after '.'");
            if (!IsDigit(input[i]))
                return LexResult::Invalid(i, ParseErrorCode::InvalidNumber, "Invalid fraction: a digit was expected after '.'");
            while (i < input.size() && IsDigit(input[i]))
                ++i;
            if (i >= input.size())
                return isEnding ? LexResult::Ok(i) : LexResult::NeedMore();
        }

        // Exponent
        if (input[i] == 'e' || input[i] == 'E')
        {
            ++i;
            if (i < input.size() && (input[i] == '+' || input[i] == '-'))
                ++i;
            if (i >= input.size())
                return EndOrNeedMore(isEnding, i, "Unexpected end of input, a digit was expected in the exponent");
            if (!IsDigit(input[i]))
                return LexResult::Invalid(i, ParseErrorCode::InvalidNumber, "Invalid exponent: a digit was expected");
            while (i < input.size() && IsDigit(input[i]))
                ++i;
            if (i >= input.size())
                return isEnding ? LexResult::Ok(i) : LexResult::NeedMore();
        }

        if (IsGluedToNumber(input[i]))
            return LexResult::Invalid(i, ParseErrorCode::InvalidNumber, "Unexpected character in a number");
        return LexResult::Ok(i);
    }

    LexResult ScanLiteral(std::string_view input, std::string_view keyword, bool isEnding) noexcept
    {
        for (UIntSize i = 0; i < keyword.size(); ++i)
        {
            if (i >= input.size())
                return EndOrNeedMore(isEnding, i, "Unexpected end of input in a literal");
            if (input[i] != keyword[i])
                return LexResult::Invalid(i, ParseErrorCode::InvalidToken, "Invalid literal, expected true, false or null");
        }
        if (keyword.size() >= input.size())
            return isEnding ? LexResult::Ok(keyword.size()) : LexResult::NeedMore();
        if (IsGluedToLiteral(input[keyword.size()]))
            return LexResult::Invalid(keyword.size(), ParseErrorCode::InvalidToken, "Invalid literal, expected true, false or null");
        return LexResult::Ok(keyword.size());
    }

    LexResult ScanEscape(std::string_view input, bool isEnding, Char32& scalar) noexcept
    {
        if (input.size() < 2)
            return EndOrNeedMore(isEnding, input.size(), "Unexpected end of input in an escape sequence");

        switch (input[1])
        {
            case '"': scalar = U'"'; return LexResult::Ok(2);
            case '\\': scalar = U'\\'; return LexResult::Ok(2);
            case '/': scalar = U'/'; return LexResult::Ok(2);
            case 'b': scalar = U'\b'; return LexResult::Ok(2);
            case 'f': scalar = U'\f'; return LexResult::Ok(2);
            case 'n': scalar = U'\n'; return LexResult::Ok(2);
            case 'r': scalar = U'\r'; return LexResult::Ok(2);
            case 't': scalar = U'\t'; return LexResult::Ok(2);
            case 'u': break;
            default:
                return LexResult::Invalid(1, ParseErrorCode::InvalidStringEscape, "Invalid escape sequence");
        }

        UInt32 unit   = 0;
        auto   result = ScanHex4(input, 2, isEnding, unit);
        if (!result.IsOk())
            return result;

        if (IsLowSurrogate(unit))
            return LexResult::Invalid(0, ParseErrorCode::InvalidUnicodeEscape, "Unpaired low surrogate in a \\u escape");
        if (!IsHighSurrogate(unit))
        {
            scalar = static_cast<Char32>(unit);
            return LexResult::Ok(6);
        }

        // A high surrogate must be followed by \uXXXX holding a low surrogate.
        if (input.size() <= 6)
            return EndOrNeedMore(isEnding, input.size(), "Unexpected end of input after a high surrogate");
        if (input[6] != '\\')
            return LexResult::Invalid(6, ParseErrorCode::InvalidUnicodeEscape, "Unpaired high surrogate: a \\u escape with a low surrogate was expected");
        if (input.size() <= 7)
            return EndOrNeedMore(isEnding, input.size(), "Unexpected end of input after a high surrogate");
        if (input[7] != 'u')
            return LexResult::Invalid(7, ParseErrorCode::InvalidUnicodeEscape, "Unpaired high surrogate: a \\u escape with a low surrogate was expected");

        UInt32 low = 0;
        result     = ScanHex4(input, 8, isEnding, low);
        if (!result.IsOk())
            return result;
        if (!IsLowSurrogate(low))
            return LexResult::Invalid(6, ParseErrorCode::InvalidUnicodeEscape, "Invalid surrogate pair: the second escape is not a low surrogate");

        scalar = static_cast<Char32>(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
        return LexResult::Ok(12);
    }

    LexResult ScanUtf8Sequence(std::string_view input, bool isEnding) noexcept
    {
        const auto lead = static_cast<unsigned char>(input[0]);

        UIntSize      length    = 0;
        unsigned char secondMin = 0x80;
        unsigned char secondMax = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)
        {
            length = 2;
        }
        else if (lead == 0xE0)
        {
            length    = 3;
            secondMin = 0xA0;
        }
        else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
        {
            length = 3;
        }
        else if (lead == 0xED)
        {
            length    = 3;
            secondMax = 0x9F;
        }
        else if (lead == 0xF0)
        {
            length    = 4;
            secondMin = 0x90;
        }
        else if (lead >= 0xF1 && lead <= 0xF3)
        {
            length = 4;
        }
        else if (lead == 0xF4)
        {
            length    = 4;
            secondMax = 0x8F;
        }
        else
        {
            return LexResult::Invalid(0, ParseErrorCode::InvalidUtf8, "Invalid UTF-8 lead byte");
        }

        for (UIntSize i = 1; i < length; ++i)
        {
            if (i >= input.size())
                return EndOrNeedMore(isEnding, i, "Unexpected end of input in a UTF-8 sequence");
            const auto          c  = static_cast<unsigned char>(input[i]);
            const unsigned char lo = (i == 1) ? secondMin : static_cast<unsigned char>(0x80);
            const unsigned char hi = (i == 1) ? secondMax : static_cast<unsigned char>(0xBF);
            if (c < lo || c > hi)
                return LexResult::Invalid(i, ParseErrorCode::InvalidUtf8, "Invalid UTF-8 continuation byte");
        }
        return LexResult::Ok(length);
    }

    LexResult ScanString(std::string_view input, bool isEnding, StringScanState& state) noexcept
    {
        UIntSize i = state.scanned;
        while (true)
        {
            if (i >= input.size())
            {
                state.scanned = i;
                return EndOrNeedMore(isEnding, i, "Unexpected end of input, the string is not terminated");
            }

            const auto c = static_cast<unsigned char>(input[i]);
            if (c == '"')
                return LexResult::Ok(i + 1);

            if (c == '\\')
            {
                state.hasEscapes = true;
                Char32 scalar    = 0;
                auto   escape    = ScanEscape(input.substr(i), isEnding, scalar);
                if (escape.NeedsMoreInput())
                {
                    state.scanned = i;
                    return escape;
                }
                if (escape.IsInvalid())
                {
                    escape.length += i;
                    return escape;
                }
                i += escape.length;
                continue;
            }

            if (c < 0x20)
            {
                if (c == '\n')
                    return LexResult::Invalid(i, ParseErrorCode::ControlCharacter, "'\\n' is not allowed in JSON strings");
                return LexResult::Invalid(i, ParseErrorCode::ControlCharacter, "Control characters must be escaped in JSON strings");
            }

            if (c >= 0x80)
            {
                auto sequence = ScanUtf8Sequence(input.substr(i), isEnding);
                if (sequence.NeedsMoreInput())
                {
                    state.scanned = i;
                    return sequence;
                }
                if (sequence.IsInvalid())
                {
                    sequence.length += i;
                    return sequence;
                }
                i += sequence.length;
                continue;
            }

            ++i;
        }
    }

    bool DecodeString(std::string_view body, std::string& out)
    {
        out.reserve(out.size() + body.size());
        UIntSize runStart = 0;
        UIntSize i        = 0;
        while (i < body.size())
        {
            if (body[i] != '\\')
            {
                ++i;
                continue;
            }
            out.append(body.data() + runStart, i - runStart);

            Char32     scalar = 0;
            const auto escape = ScanEscape(body.substr(i), true, scalar);
            if (!escape.IsOk())
                return false;
            char       encoded[4];
            const auto encodedLength = EncodeUtf8(scalar, encoded);
            out.append(encoded, encodedLength);
            i += escape.length;
            runStart = i;
        }
        out.append(body.data() + runStart, body.size() - runStart);
        return true;
    }

    UIntSize EncodeUtf8(Char32 scalar, char* out) noexcept
    {
        const auto codepoint = static_cast<UInt32>(scalar);
        if (codepoint <= 0x7F)
        {
            out[0] = static_cast<char>(codepoint);
            return 1;
        }
        if (codepoint <= 0x7FF)
        {
            out[0] = static_cast<char>(0xC0 | (codepoint >> 6));
            out[1] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 2;
        }
        if (codepoint <= 0xFFFF)
        {
            out[0] = static_cast<char>(0xE0 | (codepoint >> 12));
            out[1] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | (codepoint >> 18));
        out[1] = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 4;
    }

    void AppendEscaped(std::string_view text, std::string& out)
    {
        UIntSize runStart = 0;
        for (UIntSize i = 0; i < text.size(); ++i)
        {
            const auto  c           = static_cast<unsigned char>(text[i]);
            const char* replacement = nullptr;
            switch (c)
            {
                case '"': replacement = "\\\""; break;
                case '\\': replacement = "\\\\"; break;
                case '\b': replacement = "\\b"; break;
                case '\f': replacement = "\\f"; break;
                case '\n': replacement = "\\n"; break;
                case '\r': replacement = "\\r"; break;
                case '\t': replacement = "\\t"; break;
                default: break;
            }
            if (!replacement && c >= 0x20)
                continue;

            out.append(text.data() + runStart, i - runStart);
            if (replacement)
            {
                out += replacement;
            }
            else
            {
                const char escaped[] = {'\\', 'u', '0', '0', kHexDigits[c >> 4], kHexDigits[c & 0x0F]};
                out.append(escaped, sizeof(escaped));
            }
            runStart = i + 1;
        }
        out.append(text.data() + runStart, text.size() - runStart);
    }

    void AppendQuoted(std::string_view text, std::string& out)
    {
        out += '"';
        AppendEscaped(text, out);
        out += '"';
    }
}// namespace JEVT::Serialization::JsonLexical
