#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup msgrpc-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The deadline passed before the reply arrived
 * return make_error_code(ecode::timed_out);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace msgrpc
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of msgrpc error codes.
 */
enum class ecode : int {
   okay = 0,       //!< i.e., everything's okay.
   logic_error,    //!< Faulty logic in the program.
   argument_error, //!< An invalid argument was supplied.
   type_error,     //!< Operation violates type system.
   invalid_data,   //!< Input data (a decoded wire message) was invalid.

   timed_out,         //!< The call's deadline elapsed before a response arrived.
   connection_failed, //!< The transport reported that the connection failed.
   remote_error,      //!< The server answered with a non-empty error field.
   session_closed,    //!< The session was closed before the operation.
   no_transport       //!< No transport builder was configured.
};
} // namespace msgrpc

namespace std
{
template<> struct is_error_code_enum<msgrpc::ecode> : true_type
{};
} // namespace std

namespace msgrpc
{
const std::error_category& ecode_category() noexcept;
error_code make_error_code(ecode);
} // namespace msgrpc
