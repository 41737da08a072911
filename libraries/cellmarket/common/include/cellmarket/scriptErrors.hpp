#pragma once

#include <cstdint>
#include <system_error>

namespace cellmarket
{
   // Codes shared by every validation program. Program specific codes start at 10.
   enum class ScriptError : std::int8_t
   {
      indexOutOfBound = 1,
      itemMissing     = 2,
      lengthNotEnough = 3,
      encoding        = 4,
      overflow        = 5,
   };

   const std::error_category& scriptCategory();
   std::error_code            make_error_code(ScriptError e);
}  // namespace cellmarket

namespace std
{
   template <>
   struct is_error_code_enum<::cellmarket::ScriptError>
   {
      static constexpr bool value = true;
   };
}  // namespace std
