
#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup tandem-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The peer hung up
 * completion(make_error_code(ecode::connection_closed));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace tandem {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of tandem error codes.
 */
enum class ecode : int {
  okay = 0,           //!< i.e., everything's okay.
  parse_error,        //!< Wire payload was not valid JSON.
  invalid_request,    //!< Valid JSON, but not a valid JSON-RPC 2.0 object.
  method_not_found,   //!< No method registered under the name.
  invalid_params,     //!< The method rejected the shape of its parameters.
  internal_error,     //!< The method failed.
  resource_exceeded,  //!< A size, connection, subscription or buffer limit was hit.
  connection_closed,  //!< The transport failed or was torn down.
  timeout,            //!< A per-call deadline expired.
  duplicate_method,   //!< A method name was registered twice.
  cancelled,          //!< The caller abandoned the call.
  call_error,         //!< The peer answered with an error object.
  transport_error     //!< Failure reported by the underlying socket.
};
} // namespace tandem

namespace std {
template <> struct is_error_code_enum<tandem::ecode> : true_type {};
} // namespace std

namespace tandem {
error_code make_error_code(ecode);
const std::error_category& ecode_category() noexcept;
} // namespace tandem
