#pragma once

#include <cellmarket/ScriptContext.hpp>
#include <services/script/tokenErrors.hpp>
#include <services/script/tokenTypes.hpp>

#include <cstdint>
#include <string_view>

namespace ScriptService
{
   /// The YES/NO token type script
   ///
   /// When the market cell is consumed, the market script is responsible
   /// for the whole transaction. Otherwise tokens may only be transferred
   /// or burned, and every limit order consumed must be paid for exactly.
   ///
   /// Orders are grouped by seller, the lock args of the order cell, which
   /// hold the lock hash the seller wants to be paid to. All orders of a
   /// seller are settled together: the seller must receive
   /// sum(sold_i * limitPrice_i) in plain cells locked by that hash. If the
   /// transaction consumes a plain cell of the seller, it is the seller's own
   /// transaction and payment is not checked.
   class MarketToken
   {
     public:
      static constexpr std::string_view name = "market-token";

      static std::int8_t verify(const cellmarket::ScriptContext& ctx);
      static void        validate(const cellmarket::ScriptContext& ctx);
   };
}  // namespace ScriptService
