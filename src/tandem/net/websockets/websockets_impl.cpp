#include "stdinc.hpp"

#include "websocket-client.hpp"
#include "websocket-server.hpp"

#include "tandem/utils/error-codes.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <type_traits>

namespace tandem::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace detail {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

using AcceptorType = std::function<bool(std::shared_ptr<Transport>)>;

// ----------------------------------------------------------------------------------------- Session

/**
 * One websocket, either end, over a plain or TLS stream. Every member below `padlock_` is only
 * touched on the stream's strand.
 */
template <typename Stream>
class Session final : public Transport, public std::enable_shared_from_this<Session<Stream>> {
private:
  static constexpr bool k_is_tls = std::is_same_v<Stream, TlsStream>;

  struct PendingWrite {
    BufferType frame;
    SendCompletion completion;
  };

  const uint64_t id_{0}; //! server only
  beast::websocket::stream<Stream> ws_;
  beast::flat_buffer buffer_;
  const WebsocketOptions options_;
  std::atomic<bool> is_open_{false};
  thunk_type on_close_thunk_;

  mutable std::mutex padlock_;
  std::weak_ptr<TransportHandler> handler_;
  std::string peer_ = "<unconnected>";

  bool is_attached_ = false;
  bool is_writing_ = false;
  bool is_closing_ = false;
  bool close_delivered_ = false;
  std::optional<std::error_code> held_close_ = {}; //! closed before `attach`
  beast::websocket::close_reason close_reason_ = {};
  std::deque<PendingWrite> writes_;

  asio::ip::tcp::resolver resolver_; //! client only
  std::string host_;                 //! client only
  std::string target_;               //! client only
  ConnectHandler on_connect_;        //! client only

public:
  template <typename... Args>
  Session(uint64_t id, WebsocketOptions options, Args&&... args)
      : id_{id}, ws_{std::forward<Args>(args)...}, options_{options},
        resolver_{ws_.get_executor()} {}

  ~Session() override {
    TRACE("session {} destroyed", id_);
    if (on_close_thunk_)
      on_close_thunk_();
  }

  //@{ Transport
  void attach(std::weak_ptr<TransportHandler> handler) override {
    {
      std::lock_guard lock{padlock_};
      handler_ = std::move(handler);
    }
    asio::dispatch(ws_.get_executor(), [self = this->shared_from_this()]() {
      self->is_attached_ = true;
      if (self->held_close_.has_value())
        self->deliver_close_(*self->held_close_);
      else if (self->is_open_.load())
        self->do_read_();
    });
  }

  void send_message(BufferType&& frame, SendCompletion completion = nullptr) override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), frame = std::move(frame),
                                    completion = std::move(completion)]() mutable {
      self->queue_write_(PendingWrite{std::move(frame), std::move(completion)});
    });
  }

  void close(uint16_t close_code = 1000, std::string_view reason = "") override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), close_code,
                                    reason = std::string{reason}]() {
      if (!self->is_open_.load() || self->is_closing_)
        return;
      self->is_closing_ = true;
      self->close_reason_ = beast::websocket::close_reason{
          beast::websocket::close_code{close_code}, beast::string_view{reason.data(), reason.size()}};
      if (!self->is_writing_) // else closed once the writes drain
        self->do_close_();
    });
  }

  bool is_open() const override { return is_open_.load(); }

  std::string peer() const override {
    std::lock_guard lock{padlock_};
    return peer_;
  }
  //@}

  // @{ Server side functions
  void run_server_session(AcceptorType acceptor, thunk_type on_close_thunk) {
    on_close_thunk_ = std::move(on_close_thunk); // deletes server-side resources
    asio::dispatch(ws_.get_executor(),
                   [self = this->shared_from_this(), acceptor = std::move(acceptor)]() mutable {
                     self->on_run_server_session_(std::move(acceptor));
                   });
  }

  void cancel_socket() {
    asio::post(ws_.get_executor(), [self = this->shared_from_this()]() {
      beast::get_lowest_layer(self->ws_).cancel();
    });
  }
  // @}

  // @{ Client side functions
  void connect(const WebsocketClientConfig& config, ConnectHandler on_connect) {
    host_ = config.host;
    target_ = config.target;
    on_connect_ = std::move(on_connect);
    if constexpr (k_is_tls) {
      ws_.next_layer().set_verify_mode(config.verify_peer ? asio::ssl::verify_peer
                                                          : asio::ssl::verify_none);
      if (config.verify_peer)
        ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification(host_));
    }

    // Look up the domain name
    resolver_.async_resolve(
        host_, std::to_string(config.port),
        beast::bind_front_handler(&Session::on_resolve_, this->shared_from_this()));
  }
  // @}

private:
  void set_stream_options_(beast::role_type role) {
    auto timeout = beast::websocket::stream_base::timeout::suggested(role);
    timeout.handshake_timeout = options_.handshake_timeout;
    timeout.idle_timeout = options_.idle_timeout;
    timeout.keep_alive_pings = options_.keep_alive_pings;
    ws_.set_option(timeout);
    ws_.read_message_max(options_.read_message_max);
    ws_.text(true);
  }

  std::string describe_peer_() {
    beast::error_code ec;
    const auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    if (ec)
      return "<unknown>";
    return format("{}://{}:{}", (k_is_tls ? "wss" : "ws"), endpoint.address().to_string(),
                  endpoint.port());
  }

  void set_open_() {
    {
      std::lock_guard lock{padlock_};
      peer_ = describe_peer_();
    }
    is_open_.store(true);
  }

  // ------------------------------------------------------------------------------- server side

  void on_run_server_session_(AcceptorType acceptor) {
    if constexpr (k_is_tls) {
      beast::get_lowest_layer(ws_).expires_after(options_.handshake_timeout);
      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::server,
          [self = this->shared_from_this(), acceptor = std::move(acceptor)](
              beast::error_code ec) mutable {
            if (ec) {
              self->on_error_(WebsocketOperation::HANDSHAKE, ec);
              return;
            }
            self->do_server_accept_(std::move(acceptor));
          });
    } else {
      do_server_accept_(std::move(acceptor));
    }
  }

  void do_server_accept_(AcceptorType acceptor) {
    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();
    set_stream_options_(beast::role_type::server);

    // Set a decorator to change the Server of the handshake
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::response_type& res) {
          res.set(beast::http::field::server,
                  std::string(BOOST_BEAST_VERSION_STRING) + " tandem-server");
        }));

    ws_.async_accept([self = this->shared_from_this(),
                      acceptor = std::move(acceptor)](beast::error_code ec) mutable {
      if (ec) {
        self->on_error_(WebsocketOperation::ACCEPT, ec);
        return;
      }
      self->set_open_();
      TRACE("session {} accepted, peer {}", self->id_, self->peer());

      bool is_accepted = false;
      try {
        is_accepted = acceptor(self);
      } catch (std::exception& e) {
        FATAL("callback `acceptor` must not throw: {}", e.what());
      } catch (...) {
        FATAL("callback `acceptor` must not throw");
      }
      if (!is_accepted)
        self->close(1013, "Server is busy, try again later");
    });
  }

  // ------------------------------------------------------------------------------- client side

  void on_resolve_(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      on_error_(WebsocketOperation::CONNECT, ec);
      return;
    }

    // Set a timeout on the operation
    beast::get_lowest_layer(ws_).expires_after(options_.handshake_timeout);

    // Make the connection on the IP address we get from a lookup
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&Session::on_client_connect_, this->shared_from_this()));
  }

  void on_client_connect_(beast::error_code ec,
                          asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
      on_error_(WebsocketOperation::CONNECT, ec);
      return;
    }

    // Update the host_ string. This will provide the value of the
    // Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    const auto sni_host = host_;
    host_ += ':' + std::to_string(ep.port());

    if constexpr (k_is_tls) {
      // Set SNI Hostname (many hosts need this to handshake successfully)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
      const bool set_tls_successful =
          SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), sni_host.c_str());
#pragma GCC diagnostic pop
      if (!set_tls_successful) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        on_error_(WebsocketOperation::CONNECT, ec);
        return;
      }

      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::client,
          [self = this->shared_from_this()](beast::error_code ec) {
            if (ec) {
              self->on_error_(WebsocketOperation::HANDSHAKE, ec);
              return;
            }
            self->do_client_handshake_();
          });
    } else {
      do_client_handshake_();
    }
  }

  void do_client_handshake_() {
    beast::get_lowest_layer(ws_).expires_never();
    set_stream_options_(beast::role_type::client);

    // Set a decorator to change the User-Agent of the handshake
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  std::string{BOOST_BEAST_VERSION_STRING} + " tandem-client");
        }));

    ws_.async_handshake(host_, target_, [self = this->shared_from_this()](beast::error_code ec) {
      if (ec) {
        self->on_error_(WebsocketOperation::HANDSHAKE, ec);
        return;
      }
      self->set_open_();
      TRACE("connected to {}", self->peer());
      auto on_connect = std::move(self->on_connect_);
      self->on_connect_ = nullptr;
      if (on_connect)
        on_connect(std::error_code{}, self);
    });
  }

  // ----------------------------------------------------------------------------------- reading

  void do_read_() {
    ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // This indicates that the session was closed
    if (ec == beast::websocket::error::closed) {
      deliver_close_(make_error_code(ecode::connection_closed));
      return;
    }

    if (ec) {
      on_error_(WebsocketOperation::READ, ec);
      return;
    }

    const auto data = buffer_.cdata();
    const auto payload =
        std::span<const std::byte>{static_cast<const std::byte*>(data.data()), data.size()};
    if (auto handler = load_handler_()) {
      try {
        handler->on_receive(payload);
      } catch (std::exception& e) {
        FATAL("callback `on_receive` must not throw: {}", e.what());
      } catch (...) {
        FATAL("callback `on_receive` must not throw");
      }
    }

    buffer_.consume(buffer_.size()); // Clear the buffer
    do_read_();                      // Read another message
  }

  // ----------------------------------------------------------------------------------- writing

  void complete_(SendCompletion completion, std::error_code ec) {
    if (completion)
      asio::post(ws_.get_executor(), [completion = std::move(completion), ec]() { completion(ec); });
  }

  void queue_write_(PendingWrite write) {
    if (!is_open_.load() || is_closing_ || held_close_.has_value() || close_delivered_) {
      complete_(std::move(write.completion), make_error_code(ecode::connection_closed));
      return;
    }
    writes_.push_back(std::move(write));
    if (!is_writing_)
      do_write_();
  }

  void do_write_() {
    is_writing_ = true;
    const auto& frame = writes_.front().frame;
    ws_.async_write(asio::buffer(frame.data(), frame.size()),
                    beast::bind_front_handler(&Session::on_write_, this->shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    is_writing_ = false;
    auto write = std::move(writes_.front());
    writes_.pop_front();
    if (write.completion)
      write.completion(ec);

    if (ec) {
      on_error_(WebsocketOperation::WRITE, ec);
      return;
    }

    if (!writes_.empty())
      do_write_();
    else if (is_closing_)
      do_close_();
  }

  // ----------------------------------------------------------------------------------- closing

  void do_close_() {
    ws_.async_close(close_reason_, [self = this->shared_from_this()](beast::error_code ec) {
      if (ec && ec != asio::error::operation_aborted) {
        LOG_DEBUG("session {} close: {}", self->id_, ec.message());
      }
      self->deliver_close_(make_error_code(ecode::connection_closed));
    });
  }

  void on_error_(WebsocketOperation operation, beast::error_code ec) {
    if (ec != asio::error::operation_aborted) {
      LOG_DEBUG("session {} ({}) error on {}: {}", id_, peer(), str(operation), ec.message());
    }
    if (operation == WebsocketOperation::CONNECT || operation == WebsocketOperation::HANDSHAKE) {
      if (auto on_connect = std::move(on_connect_)) { // client side
        on_connect_ = nullptr;
        on_connect(ec, nullptr);
        return;
      }
    }
    deliver_close_(ec);
  }

  std::shared_ptr<TransportHandler> load_handler_() const {
    std::lock_guard lock{padlock_};
    return handler_.lock();
  }

  void deliver_close_(std::error_code ec) {
    if (close_delivered_)
      return;
    is_open_.store(false);

    // Fail whatever is queued behind the write in flight
    const std::size_t first = is_writing_ ? 1 : 0;
    while (writes_.size() > first) {
      complete_(std::move(writes_.back().completion), make_error_code(ecode::connection_closed));
      writes_.pop_back();
    }

    if (!is_attached_) {
      held_close_ = ec;
      return;
    }

    close_delivered_ = true;
    held_close_.reset();
    if (auto handler = load_handler_())
      handler->on_close(ec);
  }
};

// ---------------------------------------------------------------------------------------- Listener

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener> {
private:
  asio::io_context& ioc_;
  asio::ssl::context* tls_context_; //! nullptr for plain websockets
  asio::ip::tcp::acceptor acceptor_;
  WebsocketOptions options_;
  AcceptorType on_accept_transport_;
  beast::error_code ec_;
  std::atomic<uint64_t> session_id_;

  /**
   * When a session destructs, a callback should delete from this session
   */
  std::mutex padlock_;
  std::unordered_map<uint64_t, std::weak_ptr<Transport>> sessions_;
  bool is_shutdown_ = false;

public:
  Listener(asio::io_context& ioc, asio::ssl::context* tls_context,
           asio::ip::tcp::endpoint endpoint, WebsocketOptions options, AcceptorType acceptor)
      : ioc_{ioc}, tls_context_{tls_context}, acceptor_{asio::make_strand(ioc)},
        options_{options}, on_accept_transport_{std::move(acceptor)}, ec_{}, session_id_{1} {
    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec_);
    if (ec_)
      return;

    // Allow address reuse
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec_);
    if (ec_)
      return;

    // Bind to the server address
    acceptor_.bind(endpoint, ec_);
    if (ec_)
      return;

    // Start listening for connections
    acceptor_.listen(asio::socket_base::max_listen_connections, ec_);
    if (ec_)
      return;
  }

  // Start accepting incoming connections
  beast::error_code run() {
    if (!ec_)
      do_accept_();
    return ec_;
  }

  uint16_t port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  void shutdown() {
    {
      std::lock_guard lock{padlock_};
      is_shutdown_ = true;
    }
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() { self->finish_shutdown_(); });
  }

private:
  void do_accept_() {
    // The new connection gets its own strand
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::on_accept_, shared_from_this()));
  }

  void on_accept_(beast::error_code ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted)
      return; // shutdown

    if (ec) {
      INFO("websocket-server on-accept error: {}", ec.message());
    } else {
      const auto id = session_id_.fetch_add(1, std::memory_order_acq_rel);
      if (tls_context_ != nullptr)
        launch_(id, std::make_shared<Session<TlsStream>>(id, options_, std::move(socket),
                                                         *tls_context_));
      else
        launch_(id, std::make_shared<Session<PlainStream>>(id, options_, std::move(socket)));
    }

    // Accept another connection
    do_accept_();
  }

  template <typename SessionType>
  void launch_(uint64_t id, std::shared_ptr<SessionType> session) {
    bool is_shutdown = false;
    {
      std::lock_guard lock{padlock_};
      is_shutdown = is_shutdown_;
      if (!is_shutdown)
        sessions_.insert({id, session});
    }

    if (is_shutdown) {
      session->cancel_socket();
      return;
    }

    session->run_server_session(on_accept_transport_, [weak = weak_from_this(), id]() {
      if (auto self = weak.lock())
        self->remove_session_(id);
    });
  }

  void remove_session_(uint64_t id) {
    std::lock_guard lock{padlock_};
    sessions_.erase(id);
  }

  void finish_shutdown_() {
    beast::error_code ec;
    acceptor_.close(ec); // stop listening

    decltype(sessions_) sessions;
    { // clean out the current sessions
      std::lock_guard lock{padlock_};
      using std::swap;
      swap(sessions, sessions_);
    }

    for (auto& session : sessions)
      if (auto ptr = session.second.lock())
        ptr->close(1001, "going away");
  }
};

} // namespace detail

// ------------------------------------------------------------------------------------------- Pimpl

struct WebsocketServer::Pimpl {
  asio::io_context& io_context;
  std::optional<asio::ssl::context> context;
  std::shared_ptr<detail::Listener> listener = nullptr;

  Pimpl(boost::asio::io_context& io_context_, const Config& config) : io_context{io_context_} {
    if (!config.certificate_chain_file.empty()) {
      context.emplace(asio::ssl::context::tlsv12);
      context->set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                           asio::ssl::context::single_dh_use);
      context->use_certificate_chain_file(config.certificate_chain_file);
      context->use_private_key_file(config.private_key_file, boost::asio::ssl::context::pem);
      if (!config.dh_file.empty())
        context->use_tmp_dh_file(config.dh_file);
    }

    Expects(config.acceptor != nullptr);

    listener = std::make_shared<detail::Listener>(
        io_context, (context.has_value() ? &*context : nullptr),
        asio::ip::tcp::endpoint{asio::ip::make_address(config.address), config.port},
        config.options, config.acceptor);
  }
};

// ------------------------------------------------------------------------------------ Construction

WebsocketServer::WebsocketServer(boost::asio::io_context& io_context, const Config& config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)} {}

WebsocketServer::~WebsocketServer() = default;

std::error_code WebsocketServer::run() {
  // Create and launch a listening port
  if (pimpl_->listener == nullptr)
    return std::make_error_code(std::errc::not_connected);
  return pimpl_->listener->run();
}

uint16_t WebsocketServer::port() const {
  return pimpl_->listener == nullptr ? 0 : pimpl_->listener->port();
}

void WebsocketServer::shutdown() {
  TRACE("post shutdown");
  pimpl_->listener->shutdown();
}

// ----------------------------------------------------------------------------- connect_websocket

void connect_websocket(asio::io_context& io_context, const WebsocketClientConfig& config,
                       ConnectHandler on_connect) {
  if (config.use_tls) {
    static asio::ssl::context ctx = []() {
      asio::ssl::context ctx{asio::ssl::context::tlsv12_client};
      ctx.set_default_verify_paths();
      return ctx;
    }();
    auto session = std::make_shared<detail::Session<detail::TlsStream>>(
        0, config.options, asio::make_strand(io_context), ctx);
    session->connect(config, std::move(on_connect));
  } else {
    auto session = std::make_shared<detail::Session<detail::PlainStream>>(
        0, config.options, asio::make_strand(io_context));
    session->connect(config, std::move(on_connect));
  }
}

} // namespace tandem::net
