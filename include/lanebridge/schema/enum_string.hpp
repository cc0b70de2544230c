#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Names appear in logs, result `log` fields
// and the CLI; wire formats always carry the numeric value.
namespace lanebridge::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<enum_mapping_t<Enum>, N>;

inline constexpr std::string_view kUnknownEnumName{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Name of `value`, or "unknown" for a value decoded from newer peers.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  return to_string(value, mappings).value_or(kUnknownEnumName);
}

/// Specialized next to each enum that can be parsed from text.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace lanebridge::schema
