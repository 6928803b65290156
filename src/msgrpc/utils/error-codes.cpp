#include "error-codes.hpp"

#include <string>

namespace msgrpc
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "msgrpc"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::argument_error: return "argument error";
      case ecode::type_error: return "type error";
      case ecode::invalid_data: return "invalid data";
      case ecode::timed_out: return "request timed out";
      case ecode::connection_failed: return "connection failed";
      case ecode::remote_error: return "remote error";
      case ecode::session_closed: return "session closed";
      case ecode::no_transport: return "no transport";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory category_instance{};
} // namespace

/**
 * @ingroup error-codes
 * @brief The category shared by every `ecode`.
 */
const std::error_category& ecode_category() noexcept { return category_instance; }

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), category_instance}; }

} // namespace msgrpc
