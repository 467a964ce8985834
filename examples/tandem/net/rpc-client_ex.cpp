#include "stdinc.hpp"

#include "tandem/net.hpp"
#include "tandem/rpc.hpp"

#include <future>
#include <iostream>

namespace tandem::example {

struct ClientOptions {
  bool show_help = false;
  net::WebsocketClientConfig connection = {};
  string method = {};
  std::optional<rpc::Json> params = {};
  string unsubscribe_method = {}; //!< Set for subscriptions
  int count = 10;
  std::chrono::milliseconds timeout{10'000};
  string log_level = {};
};

static void show_help(const char* exec) {
  std::cout << format(R"V0G0N(

   Usage: {} [OPTIONS...] <method> [params-json]

      Calls a JSON-RPC 2.0 method on a tandem-server, and prints the result.

   Options:

      --host <host>             Default is 127.0.0.1
      --port <int>              Default is 8080
      --tls                     Connect with wss://
      --no-verify               Do not verify the server certificate
      --timeout <millis>        Default is 10000
      --unsubscribe <method>    Treat <method> as a subscription, and print notifications
      --count <int>             Notifications to print before unsubscribing. Default is 10
      --log-level <level>       trace, debug, info, warn, err, critical, off

   Examples:

      # Returns 3
      {} add '[1, 2]'

      # Prints 5 ticks
      {} --unsubscribe unsubscribe_ticks subscribe_ticks '[5, 100]'

)V0G0N",
                      exec, exec, exec);
}

static ClientOptions parse_cmd_args(int argc, char** argv) {
  ClientOptions opts;
  opts.connection.port = 8080;
  std::vector<string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    } else if (arg == "--host") {
      opts.connection.host = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--port") {
      const auto port = cli::safe_arg_int(argc, argv, i);
      if (port <= 0 || port > 65535)
        throw std::runtime_error{format("invalid port: {}", port)};
      opts.connection.port = static_cast<uint16_t>(port);
    } else if (arg == "--tls") {
      opts.connection.use_tls = true;
    } else if (arg == "--no-verify") {
      opts.connection.verify_peer = false;
    } else if (arg == "--timeout") {
      opts.timeout = std::chrono::milliseconds{std::max(1, cli::safe_arg_int(argc, argv, i))};
    } else if (arg == "--unsubscribe") {
      opts.unsubscribe_method = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--count") {
      opts.count = std::max(0, cli::safe_arg_int(argc, argv, i));
    } else if (arg == "--log-level") {
      opts.log_level = cli::safe_arg_str(argc, argv, i);
    } else if (arg.starts_with("--")) {
      throw std::runtime_error{format("unexpected argument: '{}'", arg)};
    } else {
      positional.emplace_back(arg);
    }
  }

  if (positional.empty() || positional.size() > 2)
    throw std::runtime_error{"expected <method> [params-json]"};

  opts.method = positional[0];
  if (positional.size() == 2) {
    auto params = rpc::Json::parse(positional[1], nullptr, false);
    if (params.is_discarded() || !(params.is_array() || params.is_object()))
      throw std::runtime_error{format("params must be a JSON array or object: {}", positional[1])};
    opts.params = std::move(params);
  }

  return opts;
}

// ------------------------------------------------------------------------------------------ Calls

static int print_call(rpc::Client& client, const ClientOptions& opts) {
  auto outcome = client.request(opts.method, opts.params, opts.timeout).result();
  if (!outcome) {
    std::cerr << outcome.error().to_string() << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << outcome->dump(2) << std::endl;
  return EXIT_SUCCESS;
}

static int print_subscription(rpc::Client& client, const ClientOptions& opts) {
  auto subscribed =
      client.subscribe(opts.method, opts.params, opts.unsubscribe_method, opts.timeout).result();
  if (!subscribed) {
    std::cerr << subscribed.error().to_string() << std::endl;
    return EXIT_FAILURE;
  }

  auto subscription = std::move(*subscribed);
  INFO("subscription {}", subscription.id().to_string());
  for (int i = 0; i < opts.count; ++i) {
    auto item = subscription.next_for(opts.timeout);
    if (!item.has_value()) {
      std::cerr << "timed out waiting for a notification" << std::endl;
      return EXIT_FAILURE;
    }
    if (!item->has_value()) {
      INFO("subscription ended: {}", item->error().to_string());
      break;
    }
    std::cout << rpc::dump(**item) << std::endl;
  }
  return EXIT_SUCCESS;
}

static int run_client(const ClientOptions& opts) {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  std::promise<std::pair<std::error_code, shared_ptr<net::Transport>>> connected;
  net::connect_websocket(io_context, opts.connection,
                         [&connected](std::error_code ec, shared_ptr<net::Transport> transport) {
                           connected.set_value({ec, std::move(transport)});
                         });

  auto [ec, transport] = connected.get_future().get();
  if (ec) {
    LOG_ERR("failed to connect to {}:{}: {}", opts.connection.host, opts.connection.port,
            ec.message());
    return EXIT_FAILURE;
  }

  rpc::ClientConfig config;
  config.request_timeout = opts.timeout;
  auto client = rpc::Client::make(std::move(transport), pool.timer_factory(), config);

  const auto ret = opts.unsubscribe_method.empty() ? print_call(*client, opts)
                                                   : print_subscription(*client, opts);
  client->close();
  client.reset();
  pool.stop();
  return ret;
}

int client_main(int argc, char** argv) {
  ClientOptions opts;
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
    return run_client(opts);
  } catch (std::exception& e) {
    LOG_ERR("fatal: {}", e.what());
  }
  return EXIT_FAILURE;
}

} // namespace tandem::example

int main(int argc, char** argv) { return tandem::example::client_main(argc, argv); }
