/// @file JsonTokenizer.hpp
/// @brief Window-driven JSON tokenizer producing one event per call.
#pragma once

#include <JEVT/Containers/Vector.hpp>
#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/Core/ParseError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonLexical.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace JEVT::Serialization
{
    /// @brief Limits applied by the JSON readers.
    struct JsonReaderOptions
    {
        /// Maximum number of simultaneously open arrays and objects.
        UIntSize maxDepth {1024};
        /// Upper bound of a stream reader's byte window; a single token (or a raw
        /// value being captured) must fit in it.
        UIntSize maxBufferSize {16 * 1024 * 1024};
        /// Smallest read requested from a byte source.
        UIntSize minReadSize {4096};
    };

    /// @brief Outcome of one JsonTokenizer::Next call.
    /// @details `consumedBytes` bytes at the front of the window were used and must
    /// not be presented again. No event means the window ended inside a token and the
    /// unconsumed bytes must be presented again, followed by more input.
    struct JsonTokenizerResult
    {
        UIntSize                                consumedBytes {0};
        std::optional<ParseExpected<JsonEvent>> event {};
    };

    /// @brief Incremental JSON tokenizer.
    /// @details
    /// The tokenizer owns no input. Each call looks at a caller-provided window that
    /// starts at the first byte not consumed so far. Borrowed text in a returned event
    /// points into that window.
    ///
    /// Separators (`,` and `:`) and whitespace are consumed internally. A UTF-8 BOM is
    /// skipped at the very start of the document only. After a syntax error every
    /// further call reports the same error; after Eof every further call reports Eof.
    class JEVT_API JsonTokenizer
    {
    public:
        JsonTokenizer() = default;
        explicit JsonTokenizer(const JsonReaderOptions& options);

        /// @param window Unconsumed bytes, starting where the previous call stopped.
        /// @param isEnding True when no bytes follow @p window.
        [[nodiscard]] JsonTokenizerResult Next(std::span<const Byte> window, bool isEnding);
        [[nodiscard]] JsonTokenizerResult Next(std::string_view window, bool isEnding);

        /// @brief Position of the first unconsumed byte.
        [[nodiscard]] ParseLocation Location() const noexcept { return m_location; }

        /// @brief Absolute offset of the first byte of the token behind the last event.
        [[nodiscard]] UIntSize LastTokenOffset() const noexcept { return m_lastTokenOffset; }

        [[nodiscard]] UIntSize Depth() const noexcept { return m_stack.Size(); }
        [[nodiscard]] bool     IsFinished() const noexcept { return m_eofReturned; }
        [[nodiscard]] bool     HasFailed() const noexcept { return m_error.has_value(); }

        /// @brief True when the next event is a value or the end of the current array.
        /// @details Holds at the root, after an object key and between array elements.
        [[nodiscard]] bool IsExpectingValue() const noexcept
        {
            switch (m_expect)
            {
                case Expect::Value:
                case Expect::ValueOrEnd:
                case Expect::Colon:
                    return true;
                case Expect::CommaOrEnd:
                    return m_stack.Back() == Frame::Array;
                default:
                    return false;
            }
        }

    private:
        enum class Frame : UInt8
        {
            Array,
            Object,
        };

        enum class Expect : UInt8
        {
            Value,
            ValueOrEnd,
            KeyOrEnd,
            Key,
            Colon,
            CommaOrEnd,
            Done,
        };

        JsonTokenizerResult ReadValue(std::string_view window, UIntSize pos, bool isEnding);
        JsonTokenizerResult ReadString(std::string_view window, UIntSize pos, bool isEnding, bool isKey);
        JsonTokenizerResult ReadNumber(std::string_view window, UIntSize pos, bool isEnding);
        JsonTokenizerResult ReadLiteral(std::string_view window, UIntSize pos, bool isEnding, std::string_view keyword);
        JsonTokenizerResult OpenContainer(UIntSize pos, Frame frame);
        JsonTokenizerResult CloseContainer(UIntSize pos, char closer);
        JsonTokenizerResult ReportEnd(UIntSize pos);

        JsonTokenizerResult Emit(UIntSize tokenStart, UIntSize tokenLength, JsonEvent event);
        JsonTokenizerResult Fail(UIntSize consumed, UIntSize offsetInToken, ParseErrorCode code, std::string message);
        JsonTokenizerResult FailUnexpected(UIntSize pos, char c, const char* expected);

        void AfterValue() noexcept;
        void AdvanceWhitespace(char c) noexcept;
        void AdvanceColumns(UIntSize count) noexcept;

        JsonReaderOptions                   m_options {};
        JEVT::Containers::Vector<Frame>     m_stack {};
        Expect                              m_expect {Expect::Value};
        ParseLocation                       m_location {ParseLocation::Start()};
        UIntSize                            m_lastTokenOffset {0};
        JsonLexical::StringScanState        m_stringScan {};
        std::optional<ParseError>           m_error {};
        bool                                m_bomChecked {false};
        bool                                m_afterComma {false};
        bool                                m_lastWasCarriageReturn {false};
        bool                                m_eofReturned {false};
    };
}// namespace JEVT::Serialization
