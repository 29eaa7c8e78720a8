/// @file JsonEvent.hpp
/// @brief Event model exchanged between the JSON tokenizer, the event writer and callers.
#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace JEVT::Serialization
{
    enum class JsonEventType : UInt8
    {
        StartArray,
        EndArray,
        StartObject,
        EndObject,
        ObjectKey,
        String,
        Number,
        Boolean,
        Null,
        Eof,
    };

    [[nodiscard]] JEVT_API std::string_view ToString(JsonEventType type) noexcept;

    /// @brief Text payload that either borrows bytes from a live buffer or owns a copy.
    /// @details A borrowed text is only valid while the buffer it was lexed from is
    /// alive and unmodified; for the reader adapters that means until the next call
    /// on the reader. Equality compares content only.
    class JsonText
    {
    public:
        JsonText() noexcept = default;

        [[nodiscard]] static JsonText Borrow(std::string_view text) noexcept
        {
            JsonText result;
            result.m_borrowed = text;
            return result;
        }

        [[nodiscard]] static JsonText Own(std::string text) noexcept
        {
            JsonText result;
            result.m_owned   = std::move(text);
            result.m_isOwned = true;
            return result;
        }

        [[nodiscard]] bool IsOwned() const noexcept { return m_isOwned; }

        [[nodiscard]] std::string_view View() const noexcept
        {
            return m_isOwned ? std::string_view {m_owned} : m_borrowed;
        }

        [[nodiscard]] JsonText ToOwned() const
        {
            return Own(std::string {View()});
        }

        friend bool operator==(const JsonText& lhs, const JsonText& rhs) noexcept
        {
            return lhs.View() == rhs.View();
        }

    private:
        std::string_view m_borrowed {};
        std::string      m_owned {};
        bool             m_isOwned {false};
    };

    /// @brief One unit of the JSON token stream.
    /// @details Number text is the raw literal exactly as it appeared in the input;
    /// callers convert it to whatever numeric type they need.
    class JsonEvent
    {
    public:
        JsonEvent() noexcept = default;

        [[nodiscard]] static JsonEvent StartArray() noexcept { return JsonEvent {JsonEventType::StartArray}; }
        [[nodiscard]] static JsonEvent EndArray() noexcept { return JsonEvent {JsonEventType::EndArray}; }
        [[nodiscard]] static JsonEvent StartObject() noexcept { return JsonEvent {JsonEventType::StartObject}; }
        [[nodiscard]] static JsonEvent EndObject() noexcept { return JsonEvent {JsonEventType::EndObject}; }
        [[nodiscard]] static JsonEvent Null() noexcept { return JsonEvent {JsonEventType::Null}; }
        [[nodiscard]] static JsonEvent Eof() noexcept { return JsonEvent {JsonEventType::Eof}; }

        [[nodiscard]] static JsonEvent Boolean(bool value) noexcept
        {
            JsonEvent event {JsonEventType::Boolean};
            event.m_bool = value;
            return event;
        }

        [[nodiscard]] static JsonEvent ObjectKey(JsonText text) noexcept { return JsonEvent {JsonEventType::ObjectKey, std::move(text)}; }
        [[nodiscard]] static JsonEvent String(JsonText text) noexcept { return JsonEvent {JsonEventType::String, std::move(text)}; }
        [[nodiscard]] static JsonEvent Number(JsonText text) noexcept { return JsonEvent {JsonEventType::Number, std::move(text)}; }

        /// @brief Borrowing shorthands; @p text must outlive the event.
        [[nodiscard]] static JsonEvent ObjectKey(std::string_view text) noexcept { return ObjectKey(JsonText::Borrow(text)); }
        [[nodiscard]] static JsonEvent String(std::string_view text) noexcept { return String(JsonText::Borrow(text)); }
        [[nodiscard]] static JsonEvent Number(std::string_view text) noexcept { return Number(JsonText::Borrow(text)); }
        [[nodiscard]] static JsonEvent ObjectKey(const char* text) noexcept { return ObjectKey(std::string_view {text}); }
        [[nodiscard]] static JsonEvent String(const char* text) noexcept { return String(std::string_view {text}); }
        [[nodiscard]] static JsonEvent Number(const char* text) noexcept { return Number(std::string_view {text}); }

        [[nodiscard]] JsonEventType GetType() const noexcept { return m_type; }

        [[nodiscard]] bool IsStartArray() const noexcept { return m_type == JsonEventType::StartArray; }
        [[nodiscard]] bool IsEndArray() const noexcept { return m_type == JsonEventType::EndArray; }
        [[nodiscard]] bool IsStartObject() const noexcept { return m_type == JsonEventType::StartObject; }
        [[nodiscard]] bool IsEndObject() const noexcept { return m_type == JsonEventType::EndObject; }
        [[nodiscard]] bool IsObjectKey() const noexcept { return m_type == JsonEventType::ObjectKey; }
        [[nodiscard]] bool IsString() const noexcept { return m_type == JsonEventType::String; }
        [[nodiscard]] bool IsNumber() const noexcept { return m_type == JsonEventType::Number; }
        [[nodiscard]] bool IsBoolean() const noexcept { return m_type == JsonEventType::Boolean; }
        [[nodiscard]] bool IsNull() const noexcept { return m_type == JsonEventType::Null; }
        [[nodiscard]] bool IsEof() const noexcept { return m_type == JsonEventType::Eof; }

        /// @brief True for StartArray and StartObject.
        [[nodiscard]] bool IsContainerStart() const noexcept
        {
            return m_type == JsonEventType::StartArray || m_type == JsonEventType::StartObject;
        }
        /// @brief True for EndArray and EndObject.
        [[nodiscard]] bool IsContainerEnd() const noexcept
        {
            return m_type == JsonEventType::EndArray || m_type == JsonEventType::EndObject;
        }
        [[nodiscard]] bool HasText() const noexcept
        {
            return m_type == JsonEventType::ObjectKey || m_type == JsonEventType::String || m_type == JsonEventType::Number;
        }

        /// @brief Key, string or number text; empty for other kinds.
        [[nodiscard]] std::string_view Text() const noexcept { return m_text.View(); }
        [[nodiscard]] const JsonText& GetJsonText() const noexcept { return m_text; }
        [[nodiscard]] bool            AsBool() const noexcept { return m_bool; }

        /// @brief True when the text payload owns its bytes.
        [[nodiscard]] bool IsOwned() const noexcept { return !HasText() || m_text.IsOwned(); }

        /// @brief Copy that no longer references any external buffer.
        [[nodiscard]] JsonEvent ToOwned() const
        {
            JsonEvent copy {m_type, HasText() ? m_text.ToOwned() : JsonText {}};
            copy.m_bool = m_bool;
            return copy;
        }

        friend bool operator==(const JsonEvent& lhs, const JsonEvent& rhs) noexcept
        {
            return lhs.m_type == rhs.m_type && lhs.m_bool == rhs.m_bool && lhs.m_text == rhs.m_text;
        }

    private:
        explicit JsonEvent(JsonEventType type, JsonText text = {}) noexcept
            : m_type(type), m_text(std::move(text))
        {
        }

        JsonEventType m_type {JsonEventType::Null};
        bool          m_bool {false};
        JsonText      m_text {};
    };

    /// @brief Debug rendering such as `ObjectKey("foo")` or `Number(1.5)`.
    [[nodiscard]] JEVT_API std::string ToString(const JsonEvent& event);
}// namespace JEVT::Serialization
