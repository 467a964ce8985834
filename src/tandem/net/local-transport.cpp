
#include "stdinc.hpp"

#include "local-transport.hpp"

#include "tandem/utils/error-codes.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <mutex>

namespace tandem::net {
namespace asio = boost::asio;

namespace detail {

  struct LocalEnd {
    asio::strand<asio::any_io_executor> strand;
    std::weak_ptr<TransportHandler> handler = {};
    bool attached = false;
    bool close_delivered = false;
    std::deque<BufferType> held = {}; // arrived before `attach`

    explicit LocalEnd(asio::any_io_executor executor) : strand{asio::make_strand(executor)} {}
  };

  struct LocalLink : public std::enable_shared_from_this<LocalLink> {
    mutable std::mutex padlock_;
    bool closed_ = false;
    std::array<LocalEnd, 2> ends_;
    uint64_t id_;

    explicit LocalLink(asio::any_io_executor executor, uint64_t id)
        : ends_{{LocalEnd{executor}, LocalEnd{executor}}}, id_{id} {}

    void deliver(int side, std::shared_ptr<BufferType> frame, SendCompletion completion) {
      shared_ptr<TransportHandler> handler;
      error_code ec = {};
      bool is_held = false;
      {
        std::lock_guard lock{padlock_};
        auto& end = ends_[std::size_t(side)];
        if (end.close_delivered) {
          ec = make_error_code(ecode::connection_closed);
        } else if (!end.attached || !end.held.empty()) {
          end.held.push_back(std::move(*frame));
          is_held = true;
        } else {
          handler = end.handler.lock();
        }
      }
      if (handler && !ec && !is_held)
        handler->on_receive(to_span_bytes(*frame));
      if (completion)
        completion(ec);
    }

    void deliver_close(int side) {
      shared_ptr<TransportHandler> handler;
      {
        std::lock_guard lock{padlock_};
        auto& end = ends_[std::size_t(side)];
        if (!end.attached || !end.held.empty() || end.close_delivered)
          return; // `release_held` delivers it after the held frames
        end.close_delivered = true;
        handler = end.handler.lock();
      }
      if (handler)
        handler->on_close(make_error_code(ecode::connection_closed));
    }

    void release_held(int side) {
      std::deque<BufferType> held;
      shared_ptr<TransportHandler> handler;
      bool closed = false;
      {
        std::lock_guard lock{padlock_};
        auto& end = ends_[std::size_t(side)];
        held.swap(end.held);
        handler = end.handler.lock();
        closed = closed_;
      }
      if (handler)
        for (const auto& frame : held)
          handler->on_receive(to_span_bytes(frame));
      if (closed)
        deliver_close(side);
    }
  };

} // namespace detail

static std::atomic<uint64_t> next_link_id{1};

LocalTransport::LocalTransport(std::shared_ptr<detail::LocalLink> link, int side)
    : link_{std::move(link)}, side_{side},
      name_{format("local:{}/{}", link_->id_, side == 0 ? "a" : "b")} {}

LocalTransport::~LocalTransport() { close(1001, "going away"); }

std::pair<std::shared_ptr<LocalTransport>, std::shared_ptr<LocalTransport>>
LocalTransport::make_pair(asio::any_io_executor executor) {
  auto link = std::make_shared<detail::LocalLink>(
      executor, next_link_id.fetch_add(1, std::memory_order_relaxed));
  return {std::make_shared<LocalTransport>(link, 0), std::make_shared<LocalTransport>(link, 1)};
}

void LocalTransport::attach(std::weak_ptr<TransportHandler> handler) {
  {
    std::lock_guard lock{link_->padlock_};
    auto& end = link_->ends_[std::size_t(side_)];
    Expects(!end.attached);
    end.handler = std::move(handler);
    end.attached = true;
  }
  asio::post(link_->ends_[std::size_t(side_)].strand,
             [link = link_, side = side_]() { link->release_held(side); });
}

void LocalTransport::send_message(BufferType&& frame, SendCompletion completion) {
  const int peer_side = 1 - side_;
  bool closed = false;
  {
    std::lock_guard lock{link_->padlock_};
    closed = link_->closed_;
  }

  if (closed) {
    if (completion)
      asio::post(link_->ends_[std::size_t(side_)].strand, [completion = std::move(completion)]() {
        completion(make_error_code(ecode::connection_closed));
      });
    return;
  }

  auto payload = std::make_shared<BufferType>(std::move(frame));
  asio::post(link_->ends_[std::size_t(peer_side)].strand,
             [link = link_, peer_side, payload = std::move(payload),
              completion = std::move(completion)]() mutable {
               link->deliver(peer_side, std::move(payload), std::move(completion));
             });
}

void LocalTransport::close(uint16_t close_code, std::string_view reason) {
  {
    std::lock_guard lock{link_->padlock_};
    if (link_->closed_)
      return;
    link_->closed_ = true;
  }
  TRACE("{} closed, code={}, reason='{}'", name_, close_code, reason);
  for (int side = 0; side < 2; ++side)
    asio::post(link_->ends_[std::size_t(side)].strand,
               [link = link_, side]() { link->deliver_close(side); });
}

bool LocalTransport::is_open() const {
  std::lock_guard lock{link_->padlock_};
  return !link_->closed_;
}

std::string LocalTransport::peer() const { return name_; }

} // namespace tandem::net
