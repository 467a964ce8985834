
#include "stdinc.hpp"

#include "id.hpp"

namespace tandem::rpc {

nlohmann::json Id::to_json() const {
  if (is_number())
    return nlohmann::json(number());
  if (is_string())
    return nlohmann::json(string());
  return nlohmann::json(nullptr);
}

std::optional<Id> Id::from_json(const nlohmann::json& value) {
  if (value.is_null())
    return Id{};
  if (value.is_number_unsigned())
    return Id{value.get<uint64_t>()};
  if (value.is_number_integer() && value.get<int64_t>() >= 0)
    return Id{value.get<int64_t>()};
  if (value.is_string())
    return Id{value.get<std::string>()};
  return std::nullopt; // negative, fractional, or structured
}

std::string Id::to_string() const {
  if (is_number())
    return std::to_string(number());
  if (is_string())
    return format("\"{}\"", string());
  return "null";
}

std::size_t Id::hash() const noexcept {
  if (is_number())
    return std::hash<uint64_t>{}(number());
  if (is_string())
    return std::hash<std::string>{}(string()) ^ 0x9e3779b97f4a7c15ull;
  return 0;
}

} // namespace tandem::rpc
