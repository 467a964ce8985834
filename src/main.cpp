
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "tandem/async.hpp"
#include "tandem/net.hpp"
#include "tandem/rpc.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <future>
#include <iostream>

namespace tandem {

struct ServerOptions {
  bool show_help = false;
  string address = "0.0.0.0";
  uint16_t port = 8080;
  std::size_t threads = 0;
  string certificate_chain_file = {};
  string private_key_file = {};
  string dh_file = {};
  string log_level = {};
  rpc::ServerConfig config = {};
};

static void show_help(const char* exec) {
  std::cout << format(R"V0G0N(

   Usage: {} [OPTIONS...]

      A JSON-RPC 2.0 server over websockets, serving a handful of demo methods.

   Options:

      --address <addr>          Listen address. Default is 0.0.0.0
      --port <int>              Listen port. Default is 8080
      --threads <int>           Executor threads. Default is the hardware concurrency

      --max-connections <int>   Further peers are refused with 1013
      --max-in-flight <int>     Calls executing at once, per connection
      --max-subscriptions <int> Subscriptions, per connection
      --queue-capacity <int>    Queued notifications, per subscription
      --max-request-size <n>    e.g., 512K, 10M
      --max-response-size <n>   e.g., 512K, 10M
      --max-batch-length <int>  Longer batches are refused
      --idle-timeout <secs>     Silent peers are dropped
      --no-pings                Do not send keep-alive pings

      --tls-cert <filename>     Serve wss:// with this certificate chain
      --tls-key <filename>      ...and this private key
      --tls-dh <filename>       Optional Diffie-Hellman parameters

      --log-level <level>       trace, debug, info, warn, err, critical, off

   Methods:

      echo [any...]                     Returns its params
      add [a, b]                        Returns a + b
      delayed_echo [millis, value]      Answers `value` after `millis`
      subscribe_ticks [count, millis]   Notifies `ticks` every `millis`, `count` times
      unsubscribe_ticks [id]
      rpc_methods                       Lists the methods

)V0G0N",
                      exec);
}

static ServerOptions parse_cmd_args(int argc, char** argv) {
  ServerOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--address") {
      opts.address = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--port") {
      const auto port = cli::safe_arg_int(argc, argv, i);
      if (port < 0 || port > 65535)
        throw std::runtime_error{format("invalid port: {}", port)};
      opts.port = static_cast<uint16_t>(port);
    } else if (arg == "--threads") {
      opts.threads = std::size_t(std::max(0, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--max-connections") {
      opts.config.max_connections = std::size_t(std::max(1, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--max-in-flight") {
      opts.config.max_in_flight_per_connection =
          std::size_t(std::max(1, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--max-subscriptions") {
      opts.config.max_subscriptions_per_connection =
          std::size_t(std::max(0, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--queue-capacity") {
      opts.config.subscription_queue_capacity =
          std::size_t(std::max(1, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--max-request-size") {
      opts.config.max_request_body_size = cli::safe_arg_bytes(argc, argv, i);
    } else if (arg == "--max-response-size") {
      opts.config.max_response_body_size = cli::safe_arg_bytes(argc, argv, i);
    } else if (arg == "--max-batch-length") {
      opts.config.max_batch_length = std::size_t(std::max(1, cli::safe_arg_int(argc, argv, i)));
    } else if (arg == "--idle-timeout") {
      opts.config.idle_timeout = std::chrono::seconds{std::max(1, cli::safe_arg_int(argc, argv, i))};
    } else if (arg == "--no-pings") {
      opts.config.keep_alive_pings = false;
    } else if (arg == "--tls-cert") {
      opts.certificate_chain_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--tls-key") {
      opts.private_key_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--tls-dh") {
      opts.dh_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--log-level") {
      opts.log_level = cli::safe_arg_str(argc, argv, i);
    } else {
      throw std::runtime_error{format("unexpected argument: '{}'", arg)};
    }
  }

  if (opts.certificate_chain_file.empty() != opts.private_key_file.empty())
    throw std::runtime_error{"--tls-cert and --tls-key must be given together"};

  return opts;
}

// ------------------------------------------------------------------------------------------ Ticker

/// Pushes `count` numbers through a sink, one per interval, then closes it.
class Ticker : public std::enable_shared_from_this<Ticker> {
private:
  boost::asio::steady_timer timer_;
  rpc::SubscriptionSink sink_;
  const uint64_t count_;
  const std::chrono::milliseconds interval_;
  uint64_t next_ = 0;

public:
  Ticker(boost::asio::any_io_executor executor, rpc::SubscriptionSink sink, uint64_t count,
         std::chrono::milliseconds interval)
      : timer_{executor}, sink_{std::move(sink)}, count_{count}, interval_{interval} {}

  void schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
      if (!ec)
        self->tick_();
    });
  }

private:
  void tick_() {
    if (next_ >= count_) {
      sink_.close();
      return;
    }
    // Executor threads never block on the sink; a full queue just delays the tick
    const auto status = sink_.try_send(rpc::Json(next_));
    if (status == async::ChannelStatus::CLOSED)
      return; // unsubscribed
    if (status == async::ChannelStatus::OK)
      ++next_;
    if (next_ >= count_) {
      sink_.close();
      return;
    }
    schedule();
  }
};

// ----------------------------------------------------------------------------------------- Methods

static rpc::MethodRegistry make_registry(boost::asio::any_io_executor executor) {
  rpc::MethodRegistry registry;

  registry.register_method("echo", [](const rpc::Json& params) -> rpc::MethodResult {
    return params;
  });

  registry.register_method("add", [](const rpc::Json& params) -> rpc::MethodResult {
    return rpc::param<int64_t>(params, 0) + rpc::param<int64_t>(params, 1);
  });

  registry.register_async_method(
      "delayed_echo", [executor](const rpc::Json& params, shared_ptr<rpc::CallContext> context) {
        const auto millis = rpc::param<int64_t>(params, 0);
        if (millis < 0)
          throw rpc::InvalidParamsError{"delay must be non-negative"};
        auto value = params.size() > 1 ? params[1] : rpc::Json{};
        auto timer = std::make_shared<boost::asio::steady_timer>(executor);
        timer->expires_after(std::chrono::milliseconds{millis});
        timer->async_wait([timer, context, value = std::move(value)](
                              const boost::system::error_code& ec) mutable {
          if (ec)
            context->fail(rpc::internal_error(rpc::Json(ec.message())));
          else
            context->finish(std::move(value));
        });
      });

  registry.register_subscription(
      "subscribe_ticks", "ticks", "unsubscribe_ticks",
      [executor](const rpc::Json& params,
                 rpc::SubscriptionSink sink) -> tl::expected<void, rpc::ErrorObject> {
        const auto count = rpc::param<int64_t>(params, 0);
        const auto millis = rpc::param<int64_t>(params, 1);
        if (count < 0 || millis <= 0)
          return tl::make_unexpected(
              rpc::invalid_params(rpc::Json("expected [count >= 0, millis > 0]")));
        auto ticker = std::make_shared<Ticker>(executor, std::move(sink), uint64_t(count),
                                               std::chrono::milliseconds{millis});
        ticker->schedule();
        return {};
      });

  auto names = registry.method_names();
  names.push_back("rpc_methods");
  std::sort(begin(names), end(names));
  registry.register_method("rpc_methods", [names](const rpc::Json&) -> rpc::MethodResult {
    return rpc::Json(names);
  });

  return registry;
}

// -------------------------------------------------------------------------------------------- main

int run_server(const ServerOptions& opts) {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, opts.threads};

  auto server = rpc::Server::make(make_registry(pool.get_executor()), opts.config,
                                  pool.get_executor());

  net::WebsocketServer::Config config;
  config.address = opts.address;
  config.port = opts.port;
  config.certificate_chain_file = opts.certificate_chain_file;
  config.private_key_file = opts.private_key_file;
  config.dh_file = opts.dh_file;
  config.options.idle_timeout = opts.config.idle_timeout;
  config.options.keep_alive_pings = opts.config.keep_alive_pings;
  // Oversized requests are answered with -32007, so they must be readable
  config.options.read_message_max = opts.config.max_request_body_size * 2;
  config.acceptor = [server](shared_ptr<net::Transport> transport) {
    return server->accept(std::move(transport)).has_value();
  };

  auto websocket_server = net::WebsocketServer{io_context, config};
  if (auto ec = websocket_server.run()) {
    LOG_ERR("failed to listen on {}:{}: {}", opts.address, opts.port, ec.message());
    return EXIT_FAILURE;
  }

  std::promise<int> signalled;
  boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
  signals.async_wait([&signalled](const boost::system::error_code& ec, int signal_number) {
    signalled.set_value(ec ? 0 : signal_number);
  });

  INFO("listening on {}://{}:{}", (opts.certificate_chain_file.empty() ? "ws" : "wss"),
       opts.address, websocket_server.port());
  pool.run();

  const auto signal_number = signalled.get_future().get();
  INFO("received signal {}, shutting down", signal_number);

  websocket_server.shutdown();
  server->shutdown();
  pool.stop();

  return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
  ServerOptions opts;
  try {
    opts = parse_cmd_args(argc, argv);
  } catch (std::exception& e) {
    std::cerr << format("{}, pass -h for help", e.what()) << std::endl;
    return EXIT_FAILURE;
  }

  if (opts.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (!opts.log_level.empty() && !logging::set_log_level(opts.log_level)) {
    std::cerr << format("unknown log level: '{}'", opts.log_level) << std::endl;
    return EXIT_FAILURE;
  }

  try {
    return run_server(opts);
  } catch (std::exception& e) {
    LOG_ERR("fatal: {}", e.what());
  }
  return EXIT_FAILURE;
}

} // namespace tandem

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return tandem::main(argc, argv); }

#endif
