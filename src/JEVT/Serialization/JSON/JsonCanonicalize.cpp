#include <JEVT/Serialization/JSON/JsonCanonicalize.hpp>

#include <JEVT/Serialization/JSON/JsonReader.hpp>
#include <JEVT/Serialization/JSON/JsonWriter.hpp>

namespace JEVT::Serialization
{
    JsonExpected<std::string> CanonicalizeJson(std::string_view input, const JsonReaderOptions& options)
    {
        JsonBufferReader reader {input, options};
        JsonStringWriter writer;
        while (true)
        {
            auto event = reader.ReadNextEvent();
            if (!event)
                return std::unexpected(JsonError::FromSyntax(std::move(event.error())));
            auto written = writer.WriteEvent(*event);
            if (!written)
                return std::unexpected(std::move(written.error()));
            if (event->IsEof())
                return writer.TakeOutput();
        }
    }
}// namespace JEVT::Serialization
