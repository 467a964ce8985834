
#pragma once

#include "tandem/rpc/error-object.hpp"

#include "tandem/utils.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tandem::rpc {

class CallContext;
class SubscriptionSink;

/// What a method answers: a result value, or an error object sent verbatim.
using MethodResult = tl::expected<Json, ErrorObject>;

/**
 * @brief Thrown by a method to reject the shape of its parameters; answered with
 *        `invalid_params` carrying `what()` as data.
 */
class InvalidParamsError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

//@{ Callback kinds. `params` is null when the request had none.
struct SyncMethod {
  std::function<MethodResult(const Json& params)> callback;
};

/// Answers later, from any thread, through `context->finish(...)`.
struct AsyncMethod {
  std::function<void(const Json& params, std::shared_ptr<CallContext> context)> callback;
};

/**
 * @brief Accepts (or refuses) a subscription. On success the producer keeps `sink`, and pushes
 *        payloads through it. The callback runs on an executor thread, and must not block on
 *        the sink.
 */
struct SubscribeMethod {
  std::function<tl::expected<void, ErrorObject>(const Json& params, SubscriptionSink sink)>
      callback;
  std::string notification_method;
  std::string unsubscribe_method;
};

struct UnsubscribeMethod {
  std::string subscribe_method;
};
//@}

using MethodCallback = std::variant<SyncMethod, AsyncMethod, SubscribeMethod, UnsubscribeMethod>;

/**
 * @brief Maps method names to callbacks. Names are case sensitive.
 *
 * Registration throws `std::system_error` with `ecode::duplicate_method` if a name is already
 * bound. A server takes the registry by value, and never changes it afterwards.
 */
class MethodRegistry {
private:
  std::unordered_map<std::string, MethodCallback> methods_;

public:
  void register_method(std::string name, std::function<MethodResult(const Json&)> callback);

  void register_async_method(std::string name,
                             std::function<void(const Json&, std::shared_ptr<CallContext>)> callback);

  /**
   * @brief Binds `subscribe_name` and `unsubscribe_name` at once. Notifications are sent with
   *        `notification_name` as their method.
   */
  void register_subscription(
      std::string subscribe_name, std::string notification_name, std::string unsubscribe_name,
      std::function<tl::expected<void, ErrorObject>(const Json&, SubscriptionSink)> callback);

  /// @brief Moves every method of `other` into this registry.
  void merge(MethodRegistry&& other);

  const MethodCallback* find(std::string_view name) const;
  bool contains(std::string_view name) const { return find(name) != nullptr; }
  std::size_t size() const noexcept { return methods_.size(); }

  /// @brief Registered names, sorted.
  std::vector<std::string> method_names() const;

private:
  void check_unbound_(const std::string& name) const;
};

/**
 * @brief Runs a method body, converting escaping exceptions into error objects:
 *        `InvalidParamsError` and JSON type/range errors become `invalid_params`, anything else
 *        becomes `internal_error` with the exception text as data.
 */
template <typename F> MethodResult invoke_guarded(std::string_view method, F&& f) {
  try {
    return f();
  } catch (const InvalidParamsError& e) {
    return tl::make_unexpected(invalid_params(Json(e.what())));
  } catch (const nlohmann::json::type_error& e) {
    return tl::make_unexpected(invalid_params(Json(e.what())));
  } catch (const nlohmann::json::out_of_range& e) {
    return tl::make_unexpected(invalid_params(Json(e.what())));
  } catch (const std::exception& e) {
    WARN("method '{}' threw: {}", method, e.what());
    return tl::make_unexpected(internal_error(Json(e.what())));
  } catch (...) {
    LOG_ERR("method '{}' threw a non-standard exception", method);
    return tl::make_unexpected(internal_error());
  }
}

//@{ Parameter helpers; throw `InvalidParamsError`
/// @brief Positional parameter `index`, read as `T`.
template <typename T> T param(const Json& params, std::size_t index) {
  if (!params.is_array() || index >= params.size())
    throw InvalidParamsError{format("expected positional parameter {}", index)};
  return params[index].get<T>();
}

/// @brief Named parameter `name`, read as `T`.
template <typename T> T param(const Json& params, std::string_view name) {
  if (!params.is_object())
    throw InvalidParamsError{format("expected named parameter '{}'", name)};
  const auto ii = params.find(std::string{name});
  if (ii == params.end())
    throw InvalidParamsError{format("expected named parameter '{}'", name)};
  return ii->get<T>();
}
//@}

} // namespace tandem::rpc
