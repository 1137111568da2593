#pragma once

/// @file json.hpp
/// @brief Minimal JSON scanning helpers for exchange payloads
///
/// Values are located by walking the text, not parsed into a tree. Lookups
/// only see the top level of the object they are given, so a key inside a
/// nested object or a string never shadows a top-level member.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marketlink::json {

/// End offset of the value starting at pos (after leading whitespace), or
/// nullopt if the text there is not a well-formed JSON value
[[nodiscard]] std::optional<std::size_t> skip_value(std::string_view text, std::size_t pos);

/// True if text holds exactly one well-formed JSON value
[[nodiscard]] bool is_valid(std::string_view text);

/// True if text holds exactly one well-formed JSON object
[[nodiscard]] bool is_object(std::string_view text);

/// Raw text of a top-level member of an object, nullopt if absent or if the
/// object is malformed up to that member
[[nodiscard]] std::optional<std::string_view> member(std::string_view object, std::string_view key);

/// Raw texts of the elements of an array, nullopt if raw is not an array
[[nodiscard]] std::optional<std::vector<std::string_view>> elements(std::string_view array);

/// Decoded string value, nullopt if raw is not a string
[[nodiscard]] std::optional<std::string> as_string(std::string_view raw);

/// Integer value, nullopt if raw is not an integer that fits in 64 bits
[[nodiscard]] std::optional<std::int64_t> as_int(std::string_view raw);

[[nodiscard]] std::optional<bool> as_bool(std::string_view raw);

// Member shortcuts
[[nodiscard]] std::optional<std::string> get_string(std::string_view object, std::string_view key);
[[nodiscard]] std::optional<std::int64_t> get_int(std::string_view object, std::string_view key);
[[nodiscard]] std::optional<bool> get_bool(std::string_view object, std::string_view key);

/// Quoted and escaped JSON string literal
[[nodiscard]] std::string quote(std::string_view value);

/// JSON array of string literals
[[nodiscard]] std::string string_array(const std::vector<std::string>& values);

} // namespace marketlink::json
