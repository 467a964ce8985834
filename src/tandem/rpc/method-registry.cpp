
#include "stdinc.hpp"

#include "method-registry.hpp"

#include <algorithm>
#include <system_error>

namespace tandem::rpc {

void MethodRegistry::check_unbound_(const std::string& name) const {
  if (methods_.count(name) > 0)
    throw std::system_error{make_error_code(ecode::duplicate_method), name};
}

void MethodRegistry::register_method(std::string name,
                                     std::function<MethodResult(const Json&)> callback) {
  check_unbound_(name);
  methods_.emplace(std::move(name), SyncMethod{std::move(callback)});
}

void MethodRegistry::register_async_method(
    std::string name, std::function<void(const Json&, std::shared_ptr<CallContext>)> callback) {
  check_unbound_(name);
  methods_.emplace(std::move(name), AsyncMethod{std::move(callback)});
}

void MethodRegistry::register_subscription(
    std::string subscribe_name, std::string notification_name, std::string unsubscribe_name,
    std::function<tl::expected<void, ErrorObject>(const Json&, SubscriptionSink)> callback) {
  if (subscribe_name == unsubscribe_name)
    throw std::system_error{make_error_code(ecode::duplicate_method), subscribe_name};
  check_unbound_(subscribe_name);
  check_unbound_(unsubscribe_name);

  methods_.emplace(unsubscribe_name, UnsubscribeMethod{subscribe_name});
  methods_.emplace(std::move(subscribe_name),
                   SubscribeMethod{std::move(callback), std::move(notification_name),
                                   std::move(unsubscribe_name)});
}

void MethodRegistry::merge(MethodRegistry&& other) {
  for (const auto& [name, _] : other.methods_)
    check_unbound_(name);
  methods_.merge(other.methods_);
}

const MethodCallback* MethodRegistry::find(std::string_view name) const {
  auto ii = methods_.find(std::string{name});
  return (ii == methods_.end()) ? nullptr : &ii->second;
}

std::vector<std::string> MethodRegistry::method_names() const {
  std::vector<std::string> names;
  names.reserve(methods_.size());
  for (const auto& [name, _] : methods_)
    names.push_back(name);
  std::sort(begin(names), end(names));
  return names;
}

} // namespace tandem::rpc
