
#pragma once

#include "tandem/rpc/id-allocator.hpp"
#include "tandem/rpc/server-config.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace tandem::rpc {

struct ClientConfig {
  std::chrono::milliseconds request_timeout{60'000};            //!< Per call, unless overridden
  std::optional<std::size_t> max_concurrent_requests = {};      //!< Callers block beyond this
  IdKind id_kind = IdKind::NUMBER;                              //!< How request ids are written
  std::size_t max_request_size = 10 * k_mebibyte;               //!< Larger calls fail locally
  std::size_t max_response_size = 10 * k_mebibyte;              //!< Larger frames are discarded
  std::size_t max_buffer_capacity_per_subscription = 1024;      //!< Overflow ends the stream
  std::size_t max_log_length = 4096;                            //!< Payloads are truncated in logs
};

} // namespace tandem::rpc
