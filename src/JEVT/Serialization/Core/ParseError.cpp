#include <JEVT/Serialization/Core/ParseError.hpp>

namespace JEVT::Serialization
{
    std::string ParseError::ToString() const
    {
        if (!location.IsKnown())
            return message;
        std::string result = "Parser error at line ";
        result += std::to_string(location.line);
        result += " column ";
        result += std::to_string(location.column);
        result += ": ";
        result += message;
        return result;
    }

    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None: return "None";
            case ParseErrorCode::UnexpectedEnd: return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter: return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken: return "InvalidToken";
            case ParseErrorCode::InvalidNumber: return "InvalidNumber";
            case ParseErrorCode::InvalidStringEscape: return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape: return "InvalidUnicodeEscape";
            case ParseErrorCode::InvalidUtf8: return "InvalidUtf8";
            case ParseErrorCode::ControlCharacter: return "ControlCharacter";
            case ParseErrorCode::DepthExceeded: return "DepthExceeded";
            case ParseErrorCode::TrailingCharacters: return "TrailingCharacters";
            case ParseErrorCode::TrailingComma: return "TrailingComma";
            case ParseErrorCode::MismatchedContainer: return "MismatchedContainer";
            case ParseErrorCode::KeyExpected: return "KeyExpected";
        }
        return "Unknown";
    }
}// namespace JEVT::Serialization
