#pragma once

#include <JEVT/Defines.hpp>
#include <JEVT/Serialization/JSON/JsonError.hpp>
#include <JEVT/Serialization/JSON/JsonTokenizer.hpp>

#include <string>
#include <string_view>

namespace JEVT::Serialization
{
    /// @brief Parse a complete document and re-serialize it in compact form.
    /// @details Whitespace and a leading BOM are dropped, escapes are normalized
    /// (only the required ones are kept, `\u` escapes use lowercase hex) and number
    /// literals are copied verbatim.
    [[nodiscard]] JEVT_API JsonExpected<std::string> CanonicalizeJson(std::string_view input, const JsonReaderOptions& options = {});
}// namespace JEVT::Serialization
