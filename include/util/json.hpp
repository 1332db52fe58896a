#pragma once

#include <optional>
#include <nlohmann/json.hpp>

namespace cs::util {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

}
