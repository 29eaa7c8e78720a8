#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>

#include <string>
#include <utility>

namespace JEVT::Serialization
{
    namespace
    {
        constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

        [[nodiscard]] std::string DescribeByte(char c)
        {
            const auto byte = static_cast<unsigned char>(c);
            if (byte >= 0x20 && byte < 0x7F)
                return std::string {"character '"} + c + "'";
            constexpr char hex[] = "0123456789ABCDEF";
            std::string    result {"byte 0x"};
            result += hex[byte >> 4];
            result += hex[byte & 0x0F];
            return result;
        }
    }// namespace

    JsonTokenizer::JsonTokenizer(const JsonReaderOptions& options)
        : m_options(options)
    {
    }

    JsonTokenizerResult JsonTokenizer::Next(std::span<const Byte> window, bool isEnding)
    {
        return Next(std::string_view {reinterpret_cast<const char*>(window.data()), window.size()}, isEnding);
    }

    JsonTokenizerResult JsonTokenizer::Next(std::string_view window, bool isEnding)
    {
        if (m_error)
            return JsonTokenizerResult {0, std::unexpected(*m_error)};
        if (m_eofReturned)
            return JsonTokenizerResult {0, JsonEvent::Eof()};

        UIntSize pos = 0;
        if (!m_bomChecked)
        {
            // Wait until three bytes (or the end) are known before deciding.
            if (window.size() < kByteOrderMark.size() && !isEnding && kByteOrderMark.starts_with(window))
                return JsonTokenizerResult {0, std::nullopt};
            m_bomChecked = true;
            if (window.starts_with(kByteOrderMark))
            {
                pos = kByteOrderMark.size();
                AdvanceColumns(kByteOrderMark.size());
            }
        }

        while (true)
        {
            while (pos < window.size() && JsonLexical::IsWhitespace(window[pos]))
            {
                AdvanceWhitespace(window[pos]);
                ++pos;
            }
            if (pos >= window.size())
            {
                if (!isEnding)
                    return JsonTokenizerResult {pos, std::nullopt};
                return ReportEnd(pos);
            }

            const char c = window[pos];
            switch (m_expect)
            {
                case Expect::Done:
                    return Fail(pos, 0, ParseErrorCode::TrailingCharacters, "The JSON document already contains one root element");

                case Expect::Colon:
                    if (c != ':')
                        return FailUnexpected(pos, c, "':' after an object key");
                    AdvanceColumns(1);
                    ++pos;
                    m_expect     = Expect::Value;
                    m_afterComma = false;
                    continue;

                case Expect::CommaOrEnd:
                    if (c == ',')
                    {
                        AdvanceColumns(1);
                        ++pos;
                        m_expect     = m_stack.Back() == Frame::Array ? Expect::Value : Expect::Key;
                        m_afterComma = true;
                        continue;
                    }
                    if (c == ']' || c == '}')
                        return CloseContainer(pos, c);
                    return FailUnexpected(pos, c, m_stack.Back() == Frame::Array ? "',' or ']'" : "',' or '}'");

                case Expect::KeyOrEnd:
                    if (c == '}' || c == ']')
                        return CloseContainer(pos, c);
                    if (c == '"')
                        return ReadString(window, pos, isEnding, true);
                    return Fail(pos, 0, ParseErrorCode::KeyExpected, "Object keys must be strings");

                case Expect::Key:
                    if (c == '"')
                        return ReadString(window, pos, isEnding, true);
                    if (c == '}')
                        return Fail(pos, 0, ParseErrorCode::TrailingComma, "Trailing commas are not allowed");
                    if (c == ']')
                        return CloseContainer(pos, c);
                    return Fail(pos, 0, ParseErrorCode::KeyExpected, "Object keys must be strings");

                case Expect::ValueOrEnd:
                    if (c == ']' || c == '}')
                        return CloseContainer(pos, c);
                    return ReadValue(window, pos, isEnding);

                case Expect::Value:
                    if (c == ']' || c == '}')
                    {
                        if (m_stack.Empty())
                            return FailUnexpected(pos, c, "a JSON value");
                        if (m_afterComma && m_stack.Back() == Frame::Array && c == ']')
                            return Fail(pos, 0, ParseErrorCode::TrailingComma, "Trailing commas are not allowed");
                        if (m_afterComma)
                            return CloseContainer(pos, c);
                        return FailUnexpected(pos, c, "a value after ':'");
                    }
                    return ReadValue(window, pos, isEnding);
            }
            Unreachable();
        }
    }

    JsonTokenizerResult JsonTokenizer::ReadValue(std::string_view window, UIntSize pos, bool isEnding)
    {
        const char c = window[pos];
        switch (c)
        {
            case '{': return OpenContainer(pos, Frame::Object);
            case '[': return OpenContainer(pos, Frame::Array);
            case '"': return ReadString(window, pos, isEnding, false);
            case 't': return ReadLiteral(window, pos, isEnding, "true");
            case 'f': return ReadLiteral(window, pos, isEnding, "false");
            case 'n': return ReadLiteral(window, pos, isEnding, "null");
            default: break;
        }
        if (c == '-' || JsonLexical::IsDigit(c))
            return ReadNumber(window, pos, isEnding);
        return FailUnexpected(pos, c, "a JSON value");
    }

    JsonTokenizerResult JsonTokenizer::ReadString(std::string_view window, UIntSize pos, bool isEnding, bool isKey)
    {
        const std::string_view token  = window.substr(pos);
        const auto             result = JsonLexical::ScanString(token, isEnding, m_stringScan);
        if (result.NeedsMoreInput())
            return JsonTokenizerResult {pos, std::nullopt};

        const bool hasEscapes = m_stringScan.hasEscapes;
        m_stringScan          = {};
        if (result.IsInvalid())
            return Fail(pos, result.length, result.code, result.message);

        const std::string_view body = token.substr(1, result.length - 2);
        JsonText               text;
        if (hasEscapes)
        {
            std::string decoded;
            if (!JsonLexical::DecodeString(body, decoded))
                return Fail(pos, 0, ParseErrorCode::InvalidStringEscape, "Invalid escape sequence");
            text = JsonText::Own(std::move(decoded));
        }
        else
        {
            text = JsonText::Borrow(body);
        }

        if (isKey)
        {
            m_expect     = Expect::Colon;
            m_afterComma = false;
            return Emit(pos, result.length, JsonEvent::ObjectKey(std::move(text)));
        }
        AfterValue();
        return Emit(pos, result.length, JsonEvent::String(std::move(text)));
    }

    JsonTokenizerResult JsonTokenizer::ReadNumber(std::string_view window, UIntSize pos, bool isEnding)
    {
        const std::string_view token  = window.substr(pos);
        const auto             result = JsonLexical::ScanNumber(token, isEnding);
        if (result.NeedsMoreInput())
            return JsonTokenizerResult {pos, std::nullopt};
        if (result.IsInvalid())
            return Fail(pos, result.length, result.code, result.message);

        AfterValue();
        return Emit(pos, result.length, JsonEvent::Number(token.substr(0, result.length)));
    }

    JsonTokenizerResult JsonTokenizer::ReadLiteral(std::string_view window, UIntSize pos, bool isEnding, std::string_view keyword)
    {
        const auto result = JsonLexical::ScanLiteral(window.substr(pos), keyword, isEnding);
        if (result.NeedsMoreInput())
            return JsonTokenizerResult {pos, std::nullopt};
        if (result.IsInvalid())
            return Fail(pos, result.length, result.code, result.message);

        AfterValue();
        if (keyword == "null")
            return Emit(pos, result.length, JsonEvent::Null());
        return Emit(pos, result.length, JsonEvent::Boolean(keyword == "true"));
    }

    JsonTokenizerResult JsonTokenizer::OpenContainer(UIntSize pos, Frame frame)
    {
        if (m_stack.Size() >= m_options.maxDepth)
        {
            return Fail(pos, 0, ParseErrorCode::DepthExceeded,
                        "Maximum nesting depth of " + std::to_string(m_options.maxDepth) + " exceeded");
        }
        m_stack.PushBack(frame);
        m_afterComma = false;
        if (frame == Frame::Array)
        {
            m_expect = Expect::ValueOrEnd;
            return Emit(pos, 1, JsonEvent::StartArray());
        }
        m_expect = Expect::KeyOrEnd;
        return Emit(pos, 1, JsonEvent::StartObject());
    }

    JsonTokenizerResult JsonTokenizer::CloseContainer(UIntSize pos, char closer)
    {
        const Frame closing = closer == ']' ? Frame::Array : Frame::Object;
        if (m_stack.Empty())
            return FailUnexpected(pos, closer, "a JSON value");
        if (m_stack.Back() != closing)
        {
            if (closing == Frame::Object)
                return Fail(pos, 0, ParseErrorCode::MismatchedContainer, "Unexpected '}': the innermost open container is an array, ']' was expected");
            return Fail(pos, 0, ParseErrorCode::MismatchedContainer, "Unexpected ']': the innermost open container is an object, '}' was expected");
        }
        m_stack.PopBack();
        AfterValue();
        return Emit(pos, 1, closing == Frame::Array ? JsonEvent::EndArray() : JsonEvent::EndObject());
    }

    JsonTokenizerResult JsonTokenizer::ReportEnd(UIntSize pos)
    {
        if (m_expect == Expect::Done)
        {
            m_eofReturned     = true;
            m_lastTokenOffset = m_location.offset;
            return JsonTokenizerResult {pos, JsonEvent::Eof()};
        }
        if (m_stack.Empty())
            return Fail(pos, 0, ParseErrorCode::UnexpectedEnd, "Unexpected end of input, a JSON value was expected");
        if (m_expect == Expect::Colon)
            return Fail(pos, 0, ParseErrorCode::UnexpectedEnd, "Unexpected end of input, ':' was expected");
        if (m_stack.Back() == Frame::Array)
            return Fail(pos, 0, ParseErrorCode::UnexpectedEnd, "Unexpected end of input, the array is not closed");
        return Fail(pos, 0, ParseErrorCode::UnexpectedEnd, "Unexpected end of input, the object is not closed");
    }

    JsonTokenizerResult JsonTokenizer::Emit(UIntSize tokenStart, UIntSize tokenLength, JsonEvent event)
    {
        m_lastTokenOffset = m_location.offset;
        AdvanceColumns(tokenLength);
        return JsonTokenizerResult {tokenStart + tokenLength, std::move(event)};
    }

    JsonTokenizerResult JsonTokenizer::Fail(UIntSize consumed, UIntSize offsetInToken, ParseErrorCode code, std::string message)
    {
        ParseError err;
        err.code     = code;
        err.location = ParseLocation {m_location.offset + offsetInToken, m_location.line, m_location.column + offsetInToken};
        err.message  = std::move(message);
        m_error      = err;
        return JsonTokenizerResult {consumed, std::unexpected(std::move(err))};
    }

    JsonTokenizerResult JsonTokenizer::FailUnexpected(UIntSize pos, char c, const char* expected)
    {
        std::string message = "Unexpected ";
        message += DescribeByte(c);
        message += ", expected ";
        message += expected;
        return Fail(pos, 0, ParseErrorCode::UnexpectedCharacter, std::move(message));
    }

    void JsonTokenizer::AfterValue() noexcept
    {
        m_afterComma = false;
        m_expect     = m_stack.Empty() ? Expect::Done : Expect::CommaOrEnd;
    }

    void JsonTokenizer::AdvanceWhitespace(char c) noexcept
    {
        ++m_location.offset;
        if (c == '\n')
        {
            // CRLF is a single line break; the CR already moved to the next line.
            if (!m_lastWasCarriageReturn)
                ++m_location.line;
            m_location.column       = 1;
            m_lastWasCarriageReturn = false;
        }
        else if (c == '\r')
        {
            ++m_location.line;
            m_location.column       = 1;
            m_lastWasCarriageReturn = true;
        }
        else
        {
            ++m_location.column;
            m_lastWasCarriageReturn = false;
        }
    }

    void JsonTokenizer::AdvanceColumns(UIntSize count) noexcept
    {
        m_location.offset += count;
        m_location.column += count;
        m_lastWasCarriageReturn = false;
    }
}// namespace JEVT::Serialization
