
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace tandem::rpc {

constexpr std::size_t k_mebibyte = 1024 * 1024;

struct ServerConfig {
  std::size_t max_in_flight_per_connection = 64;        //!< Excess requests wait for a slot
  std::size_t max_request_body_size = 10 * k_mebibyte;  //!< Larger frames get -32007
  std::size_t max_response_body_size = 10 * k_mebibyte; //!< Larger responses become -32008
  std::size_t max_connections = 100;                    //!< Further transports are refused
  std::size_t max_subscriptions_per_connection = 1024;  //!< Further subscribes get -32006
  std::size_t subscription_queue_capacity = 16;         //!< Per subscription
  std::optional<std::size_t> max_batch_length = {};     //!< Longer batches get -32010
  std::size_t max_log_length = 4096;                    //!< Payloads are truncated in logs

  //@{ WebSocket binding
  std::chrono::seconds idle_timeout{300}; //!< Drop a peer that has been silent this long
  bool keep_alive_pings = true;           //!< Ping after half the idle timeout
  //@}
};

} // namespace tandem::rpc
