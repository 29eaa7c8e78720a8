#include <JEVT/Serialization/JSON/JsonEventWriter.hpp>

#include <JEVT/Serialization/JSON/JsonLexical.hpp>

namespace JEVT::Serialization
{
    namespace
    {
        [[nodiscard]] std::unexpected<JsonUsageError> Usage(JsonUsageErrorCode code, std::string message)
        {
            return std::unexpected(JsonUsageError {code, std::move(message)});
        }
    }// namespace

    std::expected<void, JsonUsageError> JsonEventWriter::Write(const JsonEvent& event, std::string& output)
    {
        if (m_finished)
            return Usage(JsonUsageErrorCode::DocumentComplete, "The document is finished, no event can follow Eof");

        switch (event.GetType())
        {
            case JsonEventType::StartArray:
            case JsonEventType::StartObject:
            {
                auto ready = BeforeValue(output);
                if (!ready)
                    return ready;
                if (event.IsStartArray())
                {
                    output += '[';
                    m_stack.PushBack(State::OpenArray);
                }
                else
                {
                    output += '{';
                    m_stack.PushBack(State::OpenObject);
                }
                return {};
            }

            case JsonEventType::EndArray:
            {
                if (m_stack.Empty())
                    return Usage(JsonUsageErrorCode::MismatchedContainer, "Closing an array that is not open");
                const State top = m_stack.Back();
                if (top != State::OpenArray && top != State::ContinuationArray)
                    return Usage(JsonUsageErrorCode::MismatchedContainer, "Closing an array while the innermost open container is an object");
                m_stack.PopBack();
                output += ']';
                AfterValue();
                return {};
            }

            case JsonEventType::EndObject:
            {
                if (m_stack.Empty())
                    return Usage(JsonUsageErrorCode::MismatchedContainer, "Closing an object that is not open");
                const State top = m_stack.Back();
                if (top == State::ObjectValue)
                    return Usage(JsonUsageErrorCode::UnexpectedEvent, "Closing an object while a value is expected after its last key");
                if (top != State::OpenObject && top != State::ContinuationObject)
                    return Usage(JsonUsageErrorCode::MismatchedContainer, "Closing an object while the innermost open container is an array");
                m_stack.PopBack();
                output += '}';
                AfterValue();
                return {};
            }

            case JsonEventType::ObjectKey:
            {
                if (m_stack.Empty())
                    return Usage(JsonUsageErrorCode::UnexpectedEvent, "Object keys are only allowed inside objects");
                State& top = m_stack.Back();
                if (top == State::OpenObject)
                {
                    JsonLexical::AppendQuoted(event.Text(), output);
                }
                else if (top == State::ContinuationObject)
                {
                    output += ',';
                    JsonLexical::AppendQuoted(event.Text(), output);
                }
                else if (top == State::ObjectValue)
                {
                    return Usage(JsonUsageErrorCode::UnexpectedEvent, "A value was expected after the previous object key");
                }
                else
                {
                    return Usage(JsonUsageErrorCode::UnexpectedEvent, "Object keys are only allowed inside objects");
                }
                output += ':';
                top = State::ObjectValue;
                return {};
            }

            case JsonEventType::String:
            case JsonEventType::Number:
            case JsonEventType::Boolean:
            case JsonEventType::Null:
            {
                auto ready = BeforeValue(output);
                if (!ready)
                    return ready;
                if (event.IsString())
                    JsonLexical::AppendQuoted(event.Text(), output);
                else if (event.IsNumber())
                    output += event.Text();
                else if (event.IsBoolean())
                    output += event.AsBool() ? "true" : "false";
                else
                    output += "null";
                AfterValue();
                return {};
            }

            case JsonEventType::Eof:
            {
                auto complete = Finish();
                if (!complete)
                    return complete;
                m_finished = true;
                return {};
            }
        }
        Unreachable();
    }

    std::expected<void, JsonUsageError> JsonEventWriter::Finish() const
    {
        if (!m_stack.Empty())
        {
            return Usage(JsonUsageErrorCode::DocumentIncomplete,
                         "The document is not complete, " + std::to_string(m_stack.Size()) + " container(s) are still open");
        }
        if (!m_rootWritten)
            return Usage(JsonUsageErrorCode::DocumentIncomplete, "The document is empty, no root value was written");
        return {};
    }

    std::expected<void, JsonUsageError> JsonEventWriter::BeforeValue(std::string& output)
    {
        if (m_stack.Empty())
        {
            if (m_rootWritten)
                return Usage(JsonUsageErrorCode::DocumentComplete, "A root JSON value has already been written");
            return {};
        }

        State& top = m_stack.Back();
        switch (top)
        {
            case State::OpenArray:
                top = State::ContinuationArray;
                return {};
            case State::ContinuationArray:
                output += ',';
                return {};
            case State::ObjectValue:
                top = State::ContinuationObject;
                return {};
            case State::OpenObject:
            case State::ContinuationObject:
                return Usage(JsonUsageErrorCode::UnexpectedEvent, "An object key was expected before this value");
        }
        Unreachable();
    }

    void JsonEventWriter::AfterValue() noexcept
    {
        if (m_stack.Empty())
            m_rootWritten = true;
    }
}// namespace JEVT::Serialization
