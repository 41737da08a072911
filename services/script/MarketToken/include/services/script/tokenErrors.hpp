#pragma once

#include <cellmarket/scriptErrors.hpp>

#include <cstdint>
#include <system_error>

namespace ScriptService
{
   // Codes 1-5 are cellmarket::ScriptError
   enum class TokenError : std::int8_t
   {
      invalidTokenArgs    = 10,
      unauthorizedMinting = 11,
      invalidRemainder    = 12,
      paymentMismatch     = 13,
   };

   const std::error_category& tokenCategory();
   std::error_code            make_error_code(TokenError e);
}  // namespace ScriptService

namespace std
{
   template <>
   struct is_error_code_enum<::ScriptService::TokenError>
   {
      static constexpr bool value = true;
   };
}  // namespace std
