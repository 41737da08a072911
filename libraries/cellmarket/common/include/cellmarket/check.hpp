#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace cellmarket
{
   /// Abort with `message`
   ///
   /// Message should be UTF8.
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw std::runtime_error((std::string)message);
   }

   /// Abort with message if `!cond`
   ///
   /// Message should be UTF8.
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }

   /// Abort with a script error code
   ///
   /// `E` must be registered with `std::is_error_code_enum`. The code
   /// travels in a `std::system_error` so that a script entry point can
   /// recover the exact integer it must return.
   template <typename E>
      requires std::is_error_code_enum_v<E>
   [[noreturn]] void abortCode(E code)
   {
      throw std::system_error(make_error_code(code));
   }

   /// Abort with a script error code if `!cond`
   template <typename E>
      requires std::is_error_code_enum_v<E>
   void check(bool cond, E code)
   {
      if (!cond)
         abortCode(code);
   }
}  // namespace cellmarket
