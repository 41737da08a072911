#pragma once

#include <cellmarket/ScriptContext.hpp>
#include <services/script/marketErrors.hpp>
#include <services/script/marketTypes.hpp>

#include <cstdint>
#include <string_view>

namespace ScriptService
{
   /// The market type script
   ///
   /// Governs the market cell: creation under a Type ID, minting and
   /// burning complete sets against collateral, resolution, and claims of
   /// winning tokens. Token cells are recognized by type hashes derived
   /// from the market cell's own payload.
   class Market
   {
     public:
      static constexpr std::string_view name = "market";

      /// Returns 0 if the transaction is a legal market transition, otherwise
      /// a MarketError or cellmarket::ScriptError code
      static std::int8_t verify(const cellmarket::ScriptContext& ctx);

      /// Same as verify, but aborts with std::system_error
      static void validate(const cellmarket::ScriptContext& ctx);
   };
}  // namespace ScriptService
