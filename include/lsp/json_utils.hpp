#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  if (j.contains(key) && !j.at(key).is_null()) {
    value = j.at(key).get<T>();
  } else {
    value = std::nullopt;
  }
}

template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

// Absent or null fields read as `fallback`
template <typename T>
void from_json_or(
    const nlohmann::json& j, const std::string& key, T& value,
    const T& fallback) {
  if (j.is_object() && j.contains(key) && !j.at(key).is_null()) {
    value = j.at(key).get<T>();
  } else {
    value = fallback;
  }
}

template <typename T>
void from_json_required(
    const nlohmann::json& j, const std::string& key, T& value) {
  j.at(key).get_to(value);
}

}  // namespace lsp
