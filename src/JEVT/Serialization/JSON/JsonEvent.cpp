#include <JEVT/Serialization/JSON/JsonEvent.hpp>

#include <JEVT/Serialization/JSON/JsonLexical.hpp>

namespace JEVT::Serialization
{
    std::string_view ToString(JsonEventType type) noexcept
    {
        switch (type)
        {
            case JsonEventType::StartArray: return "StartArray";
            case JsonEventType::EndArray: return "EndArray";
            case JsonEventType::StartObject: return "StartObject";
            case JsonEventType::EndObject: return "EndObject";
            case JsonEventType::ObjectKey: return "ObjectKey";
            case JsonEventType::String: return "String";
            case JsonEventType::Number: return "Number";
            case JsonEventType::Boolean: return "Boolean";
            case JsonEventType::Null: return "Null";
            case JsonEventType::Eof: return "Eof";
        }
        Unreachable();
    }

    std::string ToString(const JsonEvent& event)
    {
        std::string result {ToString(event.GetType())};
        switch (event.GetType())
        {
            case JsonEventType::ObjectKey:
            case JsonEventType::String:
                result += '(';
                JsonLexical::AppendQuoted(event.Text(), result);
                result += ')';
                break;
            case JsonEventType::Number:
                result += '(';
                result += event.Text();
                result += ')';
                break;
            case JsonEventType::Boolean:
                result += event.AsBool() ? "(true)" : "(false)";
                break;
            default:
                break;
        }
        return result;
    }
}// namespace JEVT::Serialization
