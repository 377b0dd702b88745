#include "json/json_value.h"

#include <utility>

namespace flakeid::json {

JsonValue::JsonValue() = default;

JsonValue::JsonValue(nlohmann::json value) : value_(std::move(value)) {}

JsonValue::ValueType JsonValue::GetType() const noexcept {
    return value_.type();
}

bool JsonValue::IsNull() const noexcept {
    return value_.is_null();
}

bool JsonValue::IsObject() const noexcept {
    return value_.is_object();
}

bool JsonValue::IsArray() const noexcept {
    return value_.is_array();
}

bool JsonValue::IsNumber() const noexcept {
    return value_.is_number();
}

bool JsonValue::IsString() const noexcept {
    return value_.is_string();
}

std::size_t JsonValue::Size() const noexcept {
    return value_.size();
}

bool JsonValue::Contains(std::string_view key) const {
    return IsObject() && value_.contains(std::string(key));
}

std::optional<JsonValue> JsonValue::Get(std::string_view key) const {
    if (!IsObject()) {
        return std::nullopt;
    }

    const auto iter = value_.find(std::string(key));
    if (iter == value_.end()) {
        return std::nullopt;
    }

    return JsonValue(*iter);
}

std::optional<JsonValue> JsonValue::Get(std::size_t index) const {
    if (!IsArray() || index >= value_.size()) {
        return std::nullopt;
    }

    return JsonValue(value_.at(index));
}

const nlohmann::json& JsonValue::Raw() const noexcept {
    return value_;
}

std::string JsonValue::Serialize(int indent) const {
    return value_.dump(indent);
}

}  // namespace flakeid::json
