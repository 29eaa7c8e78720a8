#include <JEVT/Serialization/JSON/JsonError.hpp>

namespace JEVT::Serialization
{
    std::string JsonError::ToString() const
    {
        switch (kind)
        {
            case JsonErrorKind::Syntax:
                return syntax.ToString();
            case JsonErrorKind::Usage:
                return "Invalid JSON event sequence: " + usage.message;
            case JsonErrorKind::Transport:
            {
                std::string result = "I/O error (";
                result += IO::ToString(transport.code);
                result += "): ";
                result += transport.message;
                if (transport.systemCode != 0)
                    result += " [system code " + std::to_string(transport.systemCode) + "]";
                return result;
            }
        }
        return "Unknown JSON error";
    }

    std::string_view ToString(JsonUsageErrorCode code) noexcept
    {
        switch (code)
        {
            case JsonUsageErrorCode::None: return "None";
            case JsonUsageErrorCode::UnexpectedEvent: return "UnexpectedEvent";
            case JsonUsageErrorCode::MismatchedContainer: return "MismatchedContainer";
            case JsonUsageErrorCode::DocumentComplete: return "DocumentComplete";
            case JsonUsageErrorCode::DocumentIncomplete: return "DocumentIncomplete";
            case JsonUsageErrorCode::InvalidState: return "InvalidState";
        }
        return "Unknown";
    }
}// namespace JEVT::Serialization
