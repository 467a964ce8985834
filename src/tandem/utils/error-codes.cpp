
#include "error-codes.hpp"

#include <string>

namespace tandem {
namespace {
  /**
   * @private
   */
  struct ECodeCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
  };

  /**
   * @private
   */
  const char* ECodeCategory::name() const noexcept { return "tandem"; }

  /**
   * @private
   */
  std::string ECodeCategory::message(int e) const {
    switch (static_cast<ecode>(e)) {
    case ecode::okay:
      return "okay";
    case ecode::parse_error:
      return "parse error";
    case ecode::invalid_request:
      return "invalid request";
    case ecode::method_not_found:
      return "method not found";
    case ecode::invalid_params:
      return "invalid params";
    case ecode::internal_error:
      return "internal error";
    case ecode::resource_exceeded:
      return "resource exceeded";
    case ecode::connection_closed:
      return "connection closed";
    case ecode::timeout:
      return "timeout";
    case ecode::duplicate_method:
      return "duplicate method";
    case ecode::cancelled:
      return "cancelled";
    case ecode::call_error:
      return "call error";
    case ecode::transport_error:
      return "transport error";
    }
    return "(unknown error)";
  }

  /**
   * @private
   */
  const ECodeCategory k_ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), k_ecode_category}; }

const std::error_category& ecode_category() noexcept { return k_ecode_category; }

} // namespace tandem
