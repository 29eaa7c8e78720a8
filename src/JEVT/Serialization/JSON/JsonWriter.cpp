#include <JEVT/Serialization/JSON/JsonWriter.hpp>

namespace JEVT::Serialization
{
    JsonExpected<void> JsonStringWriter::WriteEvent(const JsonEvent& event)
    {
        auto written = m_writer.Write(event, m_output);
        if (!written)
            return std::unexpected(JsonError::FromUsage(std::move(written.error())));
        return {};
    }

    JsonExpected<void> JsonStringWriter::Finish() const
    {
        auto complete = m_writer.Finish();
        if (!complete)
            return std::unexpected(JsonError::FromUsage(std::move(complete.error())));
        return {};
    }
}// namespace JEVT::Serialization
