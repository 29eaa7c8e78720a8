#include <JEVT/Serialization/JSON/JsonLexical.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace JEVT::Serialization;
using namespace JEVT::Serialization::JsonLexical;

TEST_CASE("ScanNumber accepts valid literals verbatim", "[Serialization][JSON][Lexical]")
{
    for (std::string_view literal: {"0", "-0", "0.5", "1e10", "-1.5E-3", "123456789", "1E+2", "-0.0e0"})
    {
        INFO(literal);
        const auto result = ScanNumber(literal, true);
        REQUIRE(result.IsOk());
        CHECK(result.length == literal.size());
    }
}

TEST_CASE("ScanNumber stops before structural characters", "[Serialization][JSON][Lexical]")
{
    const auto result = ScanNumber("12,3", false);
    REQUIRE(result.IsOk());
    CHECK(result.length == 2U);

    const auto inArray = ScanNumber("-4.25]", false);
    REQUIRE(inArray.IsOk());
    CHECK(inArray.length == 5U);
}

TEST_CASE("ScanNumber rejects malformed literals at the offending byte", "[Serialization][JSON][Lexical]")
{
    struct Case
    {
        std::string_view input;
        std::size_t      offset;
    };
    for (const Case& c: {Case {"01", 1}, Case {"1.", 2}, Case {"1e", 2}, Case {"-", 1}, Case {"-a", 1},
                         Case {"1.e5", 2}, Case {"1e+", 3}, Case {"2x", 1}, Case {"1.5.3", 3}, Case {"-012", 2}})
    {
        INFO(c.input);
        const auto result = ScanNumber(c.input, true);
        REQUIRE(result.IsInvalid());
        CHECK(result.length == c.offset);
    }
    CHECK(ScanNumber("01", true).code == ParseErrorCode::InvalidNumber);
    CHECK(ScanNumber("1.", true).code == ParseErrorCode::UnexpectedEnd);
}

TEST_CASE("ScanNumber asks for more input when the literal may continue", "[Serialization][JSON][Lexical]")
{
    CHECK(ScanNumber("12", false).NeedsMoreInput());
    CHECK(ScanNumber("1.", false).NeedsMoreInput());
    CHECK(ScanNumber("1e-", false).NeedsMoreInput());
    CHECK(ScanNumber("-", false).NeedsMoreInput());
    // The fault is already visible, no need to wait.
    CHECK(ScanNumber("01", false).IsInvalid());
}

TEST_CASE("ScanLiteral matches keywords exactly", "[Serialization][JSON][Lexical]")
{
    CHECK(ScanLiteral("true", "true", true).length == 4U);
    CHECK(ScanLiteral("null,", "null", false).IsOk());
    CHECK(ScanLiteral("nul", "null", false).NeedsMoreInput());
    CHECK(ScanLiteral("true", "true", false).NeedsMoreInput());

    const auto misspelled = ScanLiteral("tRue", "true", true);
    REQUIRE(misspelled.IsInvalid());
    CHECK(misspelled.length == 1U);

    const auto truncated = ScanLiteral("fals", "false", true);
    REQUIRE(truncated.IsInvalid());
    CHECK(truncated.code == ParseErrorCode::UnexpectedEnd);

    const auto glued = ScanLiteral("nullx", "null", true);
    REQUIRE(glued.IsInvalid());
    CHECK(glued.length == 4U);
}

TEST_CASE("ScanEscape decodes simple escapes", "[Serialization][JSON][Lexical]")
{
    Char32 scalar = 0;
    auto   result = ScanEscape("\\n", true, scalar);
    REQUIRE(result.IsOk());
    CHECK(result.length == 2U);
    CHECK(scalar == U'\n');

    result = ScanEscape("\\/", true, scalar);
    REQUIRE(result.IsOk());
    CHECK(scalar == U'/');

    result = ScanEscape("\\u00e9", true, scalar);
    REQUIRE(result.IsOk());
    CHECK(result.length == 6U);
    CHECK(scalar == U'\u00e9');

    result = ScanEscape("\\x", true, scalar);
    REQUIRE(result.IsInvalid());
    CHECK(result.code == ParseErrorCode::InvalidStringEscape);
    CHECK(result.length == 1U);
}

TEST_CASE("ScanEscape combines surrogate pairs", "[Serialization][JSON][Lexical]")
{
    Char32 scalar = 0;
    auto   result = ScanEscape("\\ud83d\\udd25", true, scalar);
    REQUIRE(result.IsOk());
    CHECK(result.length == 12U);
    CHECK(scalar == U'\U0001F525');
}

TEST_CASE("ScanEscape rejects unpaired surrogates", "[Serialization][JSON][Lexical]")
{
    Char32 scalar = 0;

    const auto lowAlone = ScanEscape("\\udc00", true, scalar);
    REQUIRE(lowAlone.IsInvalid());
    CHECK(lowAlone.code == ParseErrorCode::InvalidUnicodeEscape);
    CHECK(lowAlone.length == 0U);

    const auto highThenQuote = ScanEscape("\\ud800\"", true, scalar);
    REQUIRE(highThenQuote.IsInvalid());
    CHECK(highThenQuote.length == 6U);

    const auto highThenOtherEscape = ScanEscape("\\ud800\\n", true, scalar);
    REQUIRE(highThenOtherEscape.IsInvalid());
    CHECK(highThenOtherEscape.length == 7U);

    const auto highThenHigh = ScanEscape("\\ud800\\ud800", true, scalar);
    REQUIRE(highThenHigh.IsInvalid());
    CHECK(highThenHigh.length == 6U);

    const auto highAtEnd = ScanEscape("\\ud800", true, scalar);
    REQUIRE(highAtEnd.IsInvalid());
    CHECK(highAtEnd.code == ParseErrorCode::UnexpectedEnd);
}

TEST_CASE("ScanEscape waits for the rest of a split escape", "[Serialization][JSON][Lexical]")
{
    Char32 scalar = 0;
    CHECK(ScanEscape("\\", false, scalar).NeedsMoreInput());
    CHECK(ScanEscape("\\u12", false, scalar).NeedsMoreInput());
    CHECK(ScanEscape("\\ud83d", false, scalar).NeedsMoreInput());
    CHECK(ScanEscape("\\ud83d\\ud", false, scalar).NeedsMoreInput());
    // A bad hex digit is reported without waiting.
    const auto bad = ScanEscape("\\u1g", false, scalar);
    REQUIRE(bad.IsInvalid());
    CHECK(bad.length == 3U);
}

TEST_CASE("ScanUtf8Sequence follows RFC 3629", "[Serialization][JSON][Lexical]")
{
    CHECK(ScanUtf8Sequence("\xC3\xA9", true).length == 2U);
    CHECK(ScanUtf8Sequence("\xE2\x82\xAC", true).length == 3U);
    CHECK(ScanUtf8Sequence("\xF0\x9F\x94\xA5", true).length == 4U);

    CHECK(ScanUtf8Sequence("\xC0\xAF", true).IsInvalid());        // overlong
    CHECK(ScanUtf8Sequence("\xE0\x80\xAF", true).IsInvalid());    // overlong
    CHECK(ScanUtf8Sequence("\xED\xA0\x80", true).IsInvalid());    // encoded surrogate
    CHECK(ScanUtf8Sequence("\xF4\x90\x80\x80", true).IsInvalid());// above U+10FFFF
    CHECK(ScanUtf8Sequence("\x80", true).IsInvalid());            // lone continuation

    const auto badContinuation = ScanUtf8Sequence("\xE2\x82(", true);
    REQUIRE(badContinuation.IsInvalid());
    CHECK(badContinuation.length == 2U);
    CHECK(badContinuation.code == ParseErrorCode::InvalidUtf8);

    CHECK(ScanUtf8Sequence("\xF0\x9F", false).NeedsMoreInput());
}

TEST_CASE("ScanString measures the literal and notes escapes", "[Serialization][JSON][Lexical]")
{
    StringScanState plain;
    auto            result = ScanString("\"foo\": 1", false, plain);
    REQUIRE(result.IsOk());
    CHECK(result.length == 5U);
    CHECK_FALSE(plain.hasEscapes);

    StringScanState escaped;
    result = ScanString("\"a\\\"b\"", true, escaped);
    REQUIRE(result.IsOk());
    CHECK(result.length == 6U);
    CHECK(escaped.hasEscapes);
}

TEST_CASE("ScanString rejects raw control characters and bad UTF-8", "[Serialization][JSON][Lexical]")
{
    const auto newline = ScanString("\"a\nb\"", true);
    REQUIRE(newline.IsInvalid());
    CHECK(newline.code == ParseErrorCode::ControlCharacter);
    CHECK(newline.length == 2U);

    const auto tab = ScanString("\"\t\"", true);
    REQUIRE(tab.IsInvalid());
    CHECK(tab.length == 1U);

    const auto utf8 = ScanString("\"ok\xFF\"", true);
    REQUIRE(utf8.IsInvalid());
    CHECK(utf8.code == ParseErrorCode::InvalidUtf8);
    CHECK(utf8.length == 3U);

    const auto unterminated = ScanString("\"abc", true);
    REQUIRE(unterminated.IsInvalid());
    CHECK(unterminated.code == ParseErrorCode::UnexpectedEnd);
    CHECK(unterminated.length == 4U);
}

TEST_CASE("ScanString reports the earliest fault", "[Serialization][JSON][Lexical]")
{
    // Bad escape at 2 comes before the missing closing quote.
    const auto result = ScanString("\"a\\q", true);
    REQUIRE(result.IsInvalid());
    CHECK(result.code == ParseErrorCode::InvalidStringEscape);
    CHECK(result.length == 3U);

    const auto truncated = ScanString("\"a\\u12", true);
    REQUIRE(truncated.IsInvalid());
    CHECK(truncated.code == ParseErrorCode::UnexpectedEnd);
    CHECK(truncated.length == 6U);
}

TEST_CASE("ScanString resumes where it ran out of input", "[Serialization][JSON][Lexical]")
{
    StringScanState state;
    CHECK(ScanString("\"abc\\u00", false, state).NeedsMoreInput());
    CHECK(state.scanned == 4U);
    CHECK(state.hasEscapes);

    const auto result = ScanString("\"abc\\u00e9z\"", false, state);
    REQUIRE(result.IsOk());
    CHECK(result.length == 12U);
}

TEST_CASE("DecodeString resolves escapes to UTF-8", "[Serialization][JSON][Lexical]")
{
    std::string out;
    REQUIRE(DecodeString("tab\\there \\u00e9 \\ud83d\\udd25 \\\"q\\\" \\\\", out));
    CHECK(out == "tab\there \xC3\xA9 \xF0\x9F\x94\xA5 \"q\" \\");

    std::string bad;
    CHECK_FALSE(DecodeString("\\ud800", bad));
}

TEST_CASE("EncodeUtf8 covers every sequence length", "[Serialization][JSON][Lexical]")
{
    char buffer[4];
    CHECK(EncodeUtf8(U'A', buffer) == 1U);
    CHECK(EncodeUtf8(U'\u00e9', buffer) == 2U);
    CHECK(EncodeUtf8(U'\u20ac', buffer) == 3U);
    CHECK(EncodeUtf8(U'\U0001F525', buffer) == 4U);
    CHECK(std::string_view(buffer, 4) == "\xF0\x9F\x94\xA5");
}

TEST_CASE("AppendEscaped uses short forms and lowercase hex", "[Serialization][JSON][Lexical]")
{
    std::string out;
    AppendEscaped("q\"b\\\b\f\n\r\t\x01\x1f\x7f\xC3\xA9/", out);
    CHECK(out == "q\\\"b\\\\\\b\\f\\n\\r\\t\\u0001\\u001f\x7f\xC3\xA9/");

    std::string quoted;
    AppendQuoted("foo", quoted);
    CHECK(quoted == "\"foo\"");
}
