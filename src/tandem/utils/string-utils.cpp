
#include "base-include.hpp"

#include "string-utils.hpp"

#include <algorithm>
#include <cctype>

namespace tandem {
// ------------------------------------------------- Pretty Printing binary data

std::string str(const void* data, size_t sz) {
  // 0         1         2         3         4         5         6
  // 01234567890123456789012345678901234567890123456789012345678901234567
  // 00000000: 7b22 6a73 6f6e 7270 6322 3a22 322e 3022  {"jsonrpc":"2.0"

  auto ptr = static_cast<const unsigned char*>(data);

  auto hexit = [](uint8_t c) -> char {
    if (c < 10)
      return char('0' + c);
    return char('a' + (c - 10));
  };

  const auto row_sz = 68;
  const auto n_rows = (sz % 16 == 0) ? (sz / 16) : (1 + sz / 16);
  std::string out;
  out.resize(n_rows * row_sz, ' ');

  char buffer[32];
  auto process_row = [&](const auto row_number) {
    const auto row_pos = row_number * row_sz;
    snprintf(buffer, 32, "%08zx:", size_t(row_number * 16));
    std::copy(&buffer[0], &buffer[0] + 9, &out[row_pos]);
    auto pos = row_pos + 9;
    auto ascii_pos = row_pos + 51;

    auto k = row_number * 16;
    for (auto i = k; i < k + 16 and i < sz; ++i) {
      if (i % 2 == 0)
        out[pos++] = ' ';
      const auto c = ptr[i];
      out[pos++] = hexit((c >> 4) & 0x0f);
      out[pos++] = hexit((c >> 0) & 0x0f);
      out[ascii_pos++] = std::isprint(c) ? char(c) : '.';
    }
    out[row_pos + 67] = '\n';
  };

  for (std::decay_t<decltype(n_rows)> row = 0; row < n_rows; ++row)
    process_row(row);

  return out;
}

std::string str(std::span<const std::byte> data) {
  return str(static_cast<const void*>(data.data()), data.size());
}

// -------------------------------------------------------------------- Truncate

std::string truncate(std::string_view s, std::size_t max_length) {
  if (s.size() <= max_length)
    return std::string{s};
  return format("{}... ({} bytes)", s.substr(0, max_length), s.size());
}

std::string truncate(std::span<const std::byte> data, std::size_t max_length) {
  return truncate(std::string_view{reinterpret_cast<const char*>(data.data()), data.size()},
                  max_length);
}

} // namespace tandem
