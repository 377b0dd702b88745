#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "json/json_export.h"
#include "json/json_value.h"

namespace flakeid::json {

// Parses configuration documents. Comments are accepted; a parse error yields nullopt.
class JsonReader {
public:
    FLAKEID_JSON_API JsonReader() = default;

    FLAKEID_JSON_API std::optional<JsonValue> ParseString(std::string_view json_text) const;
    FLAKEID_JSON_API std::optional<JsonValue> ParseStream(std::istream& stream) const;
    FLAKEID_JSON_API std::optional<JsonValue> ParseFile(const std::string& file_path) const;
};

}  // namespace flakeid::json
