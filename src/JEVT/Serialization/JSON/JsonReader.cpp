#include <JEVT/Serialization/JSON/JsonReader.hpp>

namespace JEVT::Serialization
{
    JsonBufferReader::JsonBufferReader(std::span<const Byte> input, const JsonReaderOptions& options)
        : JsonBufferReader(std::string_view {reinterpret_cast<const char*>(input.data()), input.size()}, options)
    {
    }

    JsonBufferReader::JsonBufferReader(std::string_view input, const JsonReaderOptions& options)
        : m_input(input), m_tokenizer(options)
    {
    }

    ParseExpected<JsonEvent> JsonBufferReader::ReadNextEvent()
    {
        auto result = m_tokenizer.Next(m_input.substr(m_position), true);
        m_position += result.consumedBytes;
        if (!result.event)
        {
            // With the whole input at hand the tokenizer always decides.
            ParseError err;
            err.code     = ParseErrorCode::UnexpectedEnd;
            err.location = m_tokenizer.Location();
            err.message  = "Unexpected end of input";
            return std::unexpected(std::move(err));
        }
        return std::move(*result.event);
    }

    JsonExpected<std::optional<std::string_view>> JsonBufferReader::ReadNextValueRaw()
    {
        if (!m_tokenizer.IsExpectingValue())
            return std::unexpected(detail::MakeInvalidRawReadError());

        // Absolute tokenizer offsets equal positions in m_input.
        auto first = ReadNextEvent();
        if (!first)
            return std::unexpected(JsonError::FromSyntax(std::move(first.error())));
        if (first->IsEndArray())
            return std::optional<std::string_view> {};

        const UIntSize valueStart = m_tokenizer.LastTokenOffset();
        UIntSize       depth      = first->IsContainerStart() ? 1 : 0;
        while (depth > 0)
        {
            auto event = ReadNextEvent();
            if (!event)
                return std::unexpected(JsonError::FromSyntax(std::move(event.error())));
            if (event->IsContainerStart())
                ++depth;
            else if (event->IsContainerEnd())
                --depth;
        }
        return std::optional<std::string_view> {m_input.substr(valueStart, m_position - valueStart)};
    }
}// namespace JEVT::Serialization
