#pragma once

#include <cellmarket/ScriptContext.hpp>
#include <cellmarket/crypto.hpp>
#include <cellmarket/log.hpp>

#include <cstdint>
#include <string_view>
#include <system_error>

namespace cellmarket
{
   /// Runs a validation program body and converts the outcome into the
   /// program's exit code
   ///
   /// A precondition failure (std::system_error raised by `check`) becomes
   /// its error code. Any other exception is a fault of the caller's input
   /// and propagates.
   template <typename F>
   std::int8_t scriptEntry(std::string_view name, const ScriptContext& ctx, F&& body)
   {
      auto hash = to_hex(ctx.scriptHash);
      try
      {
         body(ctx);
      }
      catch (const std::system_error& e)
      {
         CELLMARKET_LOG_SCRIPT(loggers::script::get(), notice, hash)
             << name << " rejected (" << e.code().value() << "): " << e.code().message();
         return static_cast<std::int8_t>(e.code().value());
      }
      CELLMARKET_LOG_SCRIPT(loggers::script::get(), debug, hash) << name << " accepted";
      return 0;
   }
}  // namespace cellmarket
