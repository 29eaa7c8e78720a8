/// @file JsonEventWriter.hpp
/// @brief State machine turning a sequence of JSON events into compact JSON text.
#pragma once

#include <JEVT/Containers/Vector.hpp>
#include <JEVT/Defines.hpp>
#include <JEVT/Primitives.hpp>
#include <JEVT/Serialization/JSON/JsonError.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>

#include <expected>
#include <string>

namespace JEVT::Serialization
{
    /// @brief Validates event order and appends the canonical encoding of each event.
    /// @details
    /// Output is compact: no whitespace, `,` between elements and `:` after keys.
    /// An event is validated before anything is appended, so a rejected event leaves
    /// @p output untouched; output of earlier events is never rolled back.
    /// Number text is written verbatim.
    class JEVT_API JsonEventWriter
    {
    public:
        JsonEventWriter() = default;

        std::expected<void, JsonUsageError> Write(const JsonEvent& event, std::string& output);

        /// @brief Check that exactly one complete root value was written.
        [[nodiscard]] std::expected<void, JsonUsageError> Finish() const;

        /// @brief A root value was written and every container is closed.
        [[nodiscard]] bool IsComplete() const noexcept { return m_rootWritten && m_stack.Empty(); }
        /// @brief Eof was written; every further event is rejected.
        [[nodiscard]] bool     IsFinished() const noexcept { return m_finished; }
        [[nodiscard]] UIntSize Depth() const noexcept { return m_stack.Size(); }

    private:
        enum class State : UInt8
        {
            OpenArray,
            ContinuationArray,
            OpenObject,
            ContinuationObject,
            ObjectValue,
        };

        std::expected<void, JsonUsageError> BeforeValue(std::string& output);
        void                                AfterValue() noexcept;

        JEVT::Containers::Vector<State> m_stack {};
        bool                            m_rootWritten {false};
        bool                            m_finished {false};
    };
}// namespace JEVT::Serialization
