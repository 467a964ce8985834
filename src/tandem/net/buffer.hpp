
#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace tandem::net {

using BufferType = std::vector<std::byte>;

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.data() + buffer.size()};
}

inline std::string_view to_string_view(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

inline BufferType make_send_buffer(std::span<const std::byte> ss) {
  return BufferType{cbegin(ss), cend(ss)};
}

} // namespace tandem::net
