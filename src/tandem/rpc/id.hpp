
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace tandem::rpc {

/**
 * @brief A request id (or subscription id): a non-negative integer, a string, or null.
 *        Compared by structural equality, so `Id{1} != Id{"1"}`.
 */
class Id {
private:
  std::variant<std::monostate, uint64_t, std::string> value_;

public:
  Id() = default; //!< null
  template <typename T>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  Id(T value) : value_{static_cast<uint64_t>(value)} {}
  Id(std::string value) : value_{std::move(value)} {}
  Id(const char* value) : value_{std::string{value}} {}

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(value_); }
  bool is_number() const noexcept { return std::holds_alternative<uint64_t>(value_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

  uint64_t number() const { return std::get<uint64_t>(value_); }
  const std::string& string() const { return std::get<std::string>(value_); }

  nlohmann::json to_json() const;

  /// `nullopt` if `value` is not a non-negative integer, a string, or null.
  static std::optional<Id> from_json(const nlohmann::json& value);

  std::string to_string() const;

  std::size_t hash() const noexcept;

  bool operator==(const Id&) const = default;
};

} // namespace tandem::rpc

namespace std {
template <> struct hash<tandem::rpc::Id> {
  std::size_t operator()(const tandem::rpc::Id& id) const noexcept { return id.hash(); }
};
} // namespace std
