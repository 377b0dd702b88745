#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "json/json_export.h"

namespace flakeid::json {

// Read-mostly view over a parsed JSON document used by the configuration loaders.
class JsonValue {
public:
    using ValueType = nlohmann::json::value_t;

    FLAKEID_JSON_API JsonValue();
    FLAKEID_JSON_API explicit JsonValue(nlohmann::json value);

    FLAKEID_JSON_API ValueType GetType() const noexcept;
    FLAKEID_JSON_API bool IsNull() const noexcept;
    FLAKEID_JSON_API bool IsObject() const noexcept;
    FLAKEID_JSON_API bool IsArray() const noexcept;
    FLAKEID_JSON_API bool IsNumber() const noexcept;
    FLAKEID_JSON_API bool IsString() const noexcept;
    FLAKEID_JSON_API std::size_t Size() const noexcept;

    FLAKEID_JSON_API bool Contains(std::string_view key) const;
    FLAKEID_JSON_API std::optional<JsonValue> Get(std::string_view key) const;
    FLAKEID_JSON_API std::optional<JsonValue> Get(std::size_t index) const;

    // Returns nullopt when the key is missing or holds a value of another type.
    template <typename T>
    std::optional<T> GetAs(std::string_view key) const;

    template <typename T>
    std::optional<T> As() const;

    FLAKEID_JSON_API const nlohmann::json& Raw() const noexcept;

    FLAKEID_JSON_API std::string Serialize(int indent = -1) const;

private:
    nlohmann::json value_;
};

template <typename T>
std::optional<T> JsonValue::GetAs(std::string_view key) const {
    const auto nested = Get(key);
    if (!nested.has_value()) {
        return std::nullopt;
    }
    return nested->template As<T>();
}

template <typename T>
std::optional<T> JsonValue::As() const {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        if (!value_.is_boolean()) {
            return std::nullopt;
        }
    } else if constexpr (std::is_arithmetic_v<std::decay_t<T>>) {
        if (!value_.is_number()) {
            return std::nullopt;
        }
    } else if constexpr (std::is_same_v<std::decay_t<T>, std::string>) {
        if (!value_.is_string()) {
            return std::nullopt;
        }
    }

    try {
        return value_.get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

}  // namespace flakeid::json
