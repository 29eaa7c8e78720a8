#include <JEVT/Serialization/JSON/JsonEventWriter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>

using namespace JEVT::Serialization;

namespace
{
    std::string WriteAll(std::initializer_list<JsonEvent> events)
    {
        JsonEventWriter writer;
        std::string     output;
        for (const auto& event: events)
        {
            auto written = writer.Write(event, output);
            REQUIRE(written.has_value());
        }
        return output;
    }
}// namespace

TEST_CASE("JsonEventWriter writes compact output", "[Serialization][JSON][JsonEventWriter]")
{
    CHECK(WriteAll({JsonEvent::StartObject(), JsonEvent::ObjectKey("foo"), JsonEvent::Number("1"), JsonEvent::EndObject()}) ==
          R"({"foo":1})");

    CHECK(WriteAll({JsonEvent::StartArray(), JsonEvent::Boolean(true), JsonEvent::Null(), JsonEvent::String("x"),
                    JsonEvent::StartObject(), JsonEvent::EndObject(), JsonEvent::StartArray(), JsonEvent::EndArray(),
                    JsonEvent::EndArray(), JsonEvent::Eof()}) == R"([true,null,"x",{},[]])");

    CHECK(WriteAll({JsonEvent::StartObject(), JsonEvent::ObjectKey("a"), JsonEvent::StartArray(), JsonEvent::Number("1"),
                    JsonEvent::Number("2"), JsonEvent::EndArray(), JsonEvent::ObjectKey("b"), JsonEvent::Boolean(false),
                    JsonEvent::EndObject()}) == R"({"a":[1,2],"b":false})");
}

TEST_CASE("JsonEventWriter writes number text verbatim", "[Serialization][JSON][JsonEventWriter]")
{
    CHECK(WriteAll({JsonEvent::Number("-1.50E+03")}) == "-1.50E+03");
}

TEST_CASE("JsonEventWriter escapes strings and keys", "[Serialization][JSON][JsonEventWriter]")
{
    const std::string output = WriteAll({JsonEvent::StartObject(), JsonEvent::ObjectKey("k\"\n"),
                                         JsonEvent::String(std::string_view {"\x1f\t\\/\xC3\xA9"}), JsonEvent::EndObject()});
    CHECK(output == "{\"k\\\"\\n\":\"\\u001f\\t\\\\/\xC3\xA9\"}");
}

TEST_CASE("JsonEventWriter tracks completion", "[Serialization][JSON][JsonEventWriter]")
{
    JsonEventWriter writer;
    std::string     output;
    CHECK_FALSE(writer.IsComplete());
    REQUIRE(writer.Write(JsonEvent::StartArray(), output).has_value());
    CHECK(writer.Depth() == 1U);
    CHECK_FALSE(writer.IsComplete());

    const auto incomplete = writer.Finish();
    REQUIRE_FALSE(incomplete.has_value());
    CHECK(incomplete.error().code == JsonUsageErrorCode::DocumentIncomplete);

    REQUIRE(writer.Write(JsonEvent::EndArray(), output).has_value());
    CHECK(writer.IsComplete());
    CHECK(writer.Finish().has_value());
    CHECK_FALSE(writer.IsFinished());

    REQUIRE(writer.Write(JsonEvent::Eof(), output).has_value());
    CHECK(writer.IsFinished());
    CHECK(output == "[]");
}

TEST_CASE("JsonEventWriter rejects misplaced events", "[Serialization][JSON][JsonEventWriter]")
{
    SECTION("Key outside an object")
    {
        JsonEventWriter writer;
        std::string     output;
        auto            result = writer.Write(JsonEvent::ObjectKey("a"), output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == JsonUsageErrorCode::UnexpectedEvent);

        REQUIRE(writer.Write(JsonEvent::StartArray(), output).has_value());
        result = writer.Write(JsonEvent::ObjectKey("a"), output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == JsonUsageErrorCode::UnexpectedEvent);
        CHECK(output == "[");
    }

    SECTION("Value where a key is expected")
    {
        JsonEventWriter writer;
        std::string     output;
        REQUIRE(writer.Write(JsonEvent::StartObject(), output).has_value());
        const auto result = writer.Write(JsonEvent::Number("1"), output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == JsonUsageErrorCode::UnexpectedEvent);
        CHECK(output == "{");
    }

    SECTION("Two keys in a row")
    {
        JsonEventWriter writer;
        std::string     output;
        REQUIRE(writer.Write(JsonEvent::StartObject(), output).has_value());
        REQUIRE(writer.Write(JsonEvent::ObjectKey("a"), output).has_value());
        CHECK_FALSE(writer.Write(JsonEvent::ObjectKey("b"), output).has_value());
        CHECK_FALSE(writer.Write(JsonEvent::EndObject(), output).has_value());
        CHECK(output == R"({"a":)");
    }

    SECTION("Mismatched closers")
    {
        JsonEventWriter writer;
        std::string     output;
        auto            unopened = writer.Write(JsonEvent::EndArray(), output);
        REQUIRE_FALSE(unopened.has_value());
        CHECK(unopened.error().code == JsonUsageErrorCode::MismatchedContainer);

        REQUIRE(writer.Write(JsonEvent::StartObject(), output).has_value());
        const auto mismatched = writer.Write(JsonEvent::EndArray(), output);
        REQUIRE_FALSE(mismatched.has_value());
        CHECK(mismatched.error().code == JsonUsageErrorCode::MismatchedContainer);

        REQUIRE(writer.Write(JsonEvent::EndObject(), output).has_value());
        CHECK(output == "{}");
    }

    SECTION("Second root value")
    {
        JsonEventWriter writer;
        std::string     output;
        REQUIRE(writer.Write(JsonEvent::Null(), output).has_value());
        const auto result = writer.Write(JsonEvent::Null(), output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == JsonUsageErrorCode::DocumentComplete);
        CHECK(result.error().message == "A root JSON value has already been written");
    }

    SECTION("Eof too early and events after Eof")
    {
        JsonEventWriter writer;
        std::string     output;
        const auto      early = writer.Write(JsonEvent::Eof(), output);
        REQUIRE_FALSE(early.has_value());
        CHECK(early.error().code == JsonUsageErrorCode::DocumentIncomplete);

        REQUIRE(writer.Write(JsonEvent::Boolean(true), output).has_value());
        REQUIRE(writer.Write(JsonEvent::Eof(), output).has_value());
        const auto after = writer.Write(JsonEvent::StartArray(), output);
        REQUIRE_FALSE(after.has_value());
        CHECK(after.error().code == JsonUsageErrorCode::DocumentComplete);
        CHECK(output == "true");
    }
}

TEST_CASE("JsonEventWriter keeps output written before a rejected event", "[Serialization][JSON][JsonEventWriter]")
{
    JsonEventWriter writer;
    std::string     output;
    REQUIRE(writer.Write(JsonEvent::StartArray(), output).has_value());
    REQUIRE(writer.Write(JsonEvent::Number("1"), output).has_value());
    CHECK_FALSE(writer.Write(JsonEvent::EndObject(), output).has_value());
    CHECK(output == "[1");

    // The writer is still usable after a rejected event.
    REQUIRE(writer.Write(JsonEvent::EndArray(), output).has_value());
    CHECK(output == "[1]");
}
