#include <services/script/MarketToken.hpp>

#include <cellmarket/cellQuery.hpp>
#include <cellmarket/check.hpp>
#include <cellmarket/checked.hpp>
#include <cellmarket/log.hpp>
#include <cellmarket/scriptEntry.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <span>
#include <vector>

using namespace cellmarket;
using namespace ScriptService;

namespace
{
   struct Order
   {
      std::size_t   index;
      const Script& lock;
      TokenData     data;
   };

   struct Seller
   {
      std::span<const char> key;
      std::vector<Order>    orders;
   };

   auto& scriptLog()
   {
      return loggers::script::get();
   }

   // Sellers in order of their first order among the inputs
   std::vector<Seller> groupOrders(const CellQuery& query, const Checksum256& self)
   {
      std::vector<Seller>                      sellers;
      std::map<std::vector<char>, std::size_t> position;
      for (auto i : query.indices(Source::input, self))
      {
         auto data = TokenData::unpack(query.data(Source::input, i));
         if (!data.isOrder())
            continue;
         const auto& lock      = query.output(Source::input, i).lock;
         auto [iter, inserted] = position.try_emplace(lock.args, sellers.size());
         if (inserted)
            sellers.push_back(Seller{lock.args, {}});
         sellers[iter->second].orders.push_back(Order{i, lock, data});
      }
      return sellers;
   }

   // The unsold part of an order is the first output of the same token
   // locked by the same code and args at the same price. A changed price,
   // including 0, is not a remainder.
   uint128 findRemainder(const CellQuery& query, const Checksum256& self, const Order& order)
   {
      for (auto i : query.indices(Source::output, self))
      {
         const auto& lock = query.output(Source::output, i).lock;
         if (lock.codeHash != order.lock.codeHash || lock.args != order.lock.args)
            continue;
         auto data = TokenData::unpack(query.data(Source::output, i));
         if (data.limitPrice == order.data.limitPrice)
            return data.amount;
      }
      return 0;
   }

   std::optional<Checksum256> paymentLock(std::span<const char> key)
   {
      Checksum256 result;
      if (key.size() != result.size())
         return std::nullopt;
      std::copy(key.begin(), key.end(), result.begin());
      return result;
   }

   void validateSeller(const CellQuery& query, const Checksum256& self, const Seller& seller)
   {
      uint128 required = 0;
      for (const auto& order : seller.orders)
      {
         auto remainder = findRemainder(query, self, order);
         check(remainder <= order.data.amount, TokenError::invalidRemainder);
         auto sold = order.data.amount - remainder;
         auto cost = checkedMultiply(sold, order.data.limitPrice);
         check(cost.has_value(), ScriptError::overflow);
         auto total = checkedAdd(required, *cost);
         check(total.has_value(), ScriptError::overflow);
         required = *total;
         CELLMARKET_LOG(scriptLog(), debug)
             << "Order at input " << order.index << ": sold " << to_string(sold) << " at "
             << to_string(order.data.limitPrice);
      }

      auto lock = paymentLock(seller.key);
      if (lock && query.countPlain(Source::input, *lock) > 0)
      {
         CELLMARKET_LOG(scriptLog(), debug)
             << "Seller " << to_hex(seller.key) << " spends own cells, payment not checked";
         return;
      }

      uint128 paid = 0;
      if (lock)
         paid = saturatingSub(query.sumPlainCapacity(Source::output, *lock),
                              query.sumPlainCapacity(Source::input, *lock));
      CELLMARKET_LOG(scriptLog(), debug) << "Seller " << to_hex(seller.key) << " requires "
                                         << to_string(required) << ", paid " << to_string(paid);
      check(paid == required, TokenError::paymentMismatch);
   }
}  // namespace

void MarketToken::validate(const ScriptContext& ctx)
{
   auto      args = TokenArgs::unpack(ctx.script.args);
   CellQuery query{ctx.tx};

   auto inTotal  = query.sumAmounts(Source::input, ctx.scriptHash);
   auto outTotal = query.sumAmounts(Source::output, ctx.scriptHash);
   CELLMARKET_LOG(scriptLog(), debug)
       << "Token side " << static_cast<int>(args.side) << ": input " << to_string(inTotal)
       << ", output " << to_string(outTotal);

   if (query.find(Source::input, args.marketTypeHash))
   {
      CELLMARKET_LOG(scriptLog(), debug) << "Market cell in inputs, market script validates";
      return;
   }

   check(outTotal <= inTotal, TokenError::unauthorizedMinting);

   for (const auto& seller : groupOrders(query, ctx.scriptHash))
      validateSeller(query, ctx.scriptHash, seller);
}

std::int8_t MarketToken::verify(const ScriptContext& ctx)
{
   return scriptEntry(name, ctx, &MarketToken::validate);
}
