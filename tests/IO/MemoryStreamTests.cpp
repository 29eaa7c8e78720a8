#include <JEVT/IO/ByteConcepts.hpp>
#include <JEVT/IO/IByteReader.hpp>
#include <JEVT/IO/MemoryReader.hpp>
#include <JEVT/IO/MemoryWriter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string_view>

using namespace JEVT;

static_assert(IO::ByteReader<IO::MemoryReader>);
static_assert(IO::ByteReader<IO::IByteReader>);
static_assert(IO::NonBlockingByteReader<IO::MemoryReader>);
static_assert(IO::ByteWriter<IO::MemoryWriter>);
static_assert(IO::NonBlockingByteWriter<IO::MemoryWriter>);

TEST_CASE("MemoryReader reads in chunks until exhausted", "[IO][MemoryReader]")
{
    IO::MemoryReader reader {std::string_view {"[1,2,3]"}};
    std::array<Byte, 4> chunk {};

    auto first = reader.Read(chunk);
    REQUIRE(first.has_value());
    CHECK(*first == 4U);
    CHECK(static_cast<char>(chunk[0]) == '[');
    CHECK(reader.Remaining() == 3U);

    auto second = reader.Read(chunk);
    REQUIRE(second.has_value());
    CHECK(*second == 3U);
    CHECK(static_cast<char>(chunk[2]) == ']');

    auto end = reader.Read(chunk);
    REQUIRE(end.has_value());
    CHECK(*end == 0U);
}

TEST_CASE("MemoryReader skip and tell through the interface", "[IO][MemoryReader]")
{
    IO::MemoryReader reader {std::string_view {"\xEF\xBB\xBF{}"}};
    IO::IByteReader& source = reader;

    auto skipped = source.Skip(3);
    REQUIRE(skipped.has_value());
    CHECK(*skipped == 3U);
    CHECK(source.Tell().value() == 3U);

    auto overshoot = source.Skip(100);
    REQUIRE(overshoot.has_value());
    CHECK(*overshoot == 2U);
    CHECK(source.Tell().value() == 5U);
}

TEST_CASE("MemoryWriter accepts what fits and then reports BufferFull", "[IO][MemoryWriter]")
{
    std::array<Byte, 5> storage {};
    IO::MemoryWriter    writer {storage};

    const std::string_view text = "{\"a\":1}";
    auto bytes = std::span<const Byte>(reinterpret_cast<const Byte*>(text.data()), text.size());

    auto first = writer.Write(bytes);
    REQUIRE(first.has_value());
    CHECK(*first == 5U);
    CHECK(writer.WrittenText() == "{\"a\":");
    CHECK(writer.Remaining() == 0U);

    auto second = writer.Write(bytes.subspan(5));
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == IO::IOErrorCode::BufferFull);
    CHECK_FALSE(second.error().IsWouldBlock());

    CHECK(writer.Flush().has_value());
}
