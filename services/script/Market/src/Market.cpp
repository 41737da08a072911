#include <services/script/Market.hpp>

#include <cellmarket/cellQuery.hpp>
#include <cellmarket/check.hpp>
#include <cellmarket/checked.hpp>
#include <cellmarket/log.hpp>
#include <cellmarket/scriptEntry.hpp>

#include <algorithm>

using namespace cellmarket;
using namespace ScriptService;

namespace
{
   struct Supply
   {
      uint128 yes = 0;
      uint128 no  = 0;

      uint128 side(TokenSide s) const { return s == TokenSide::yes ? yes : no; }

      friend bool operator==(const Supply&, const Supply&) = default;
   };

   struct MarketCell
   {
      std::size_t       index;
      const CellOutput& cell;
      MarketData        data;
   };

   auto& scriptLog()
   {
      return loggers::script::get();
   }

   MarketCell loadMarketCell(const CellQuery& query, Source source, const Checksum256& self)
   {
      auto index = query.find(source, self);
      check(index.has_value(), ScriptError::itemMissing);
      return MarketCell{*index, query.output(source, *index),
                        MarketData::unpack(query.data(source, *index))};
   }

   std::span<const char> marketId(const CellOutput& cell)
   {
      check(cell.type && cell.type->args.size() == marketIdSize, MarketError::invalidMarketArgs);
      return cell.type->args;
   }

   Supply loadSupply(const CellQuery&   query,
                     Source             source,
                     const MarketData&  data,
                     const Checksum256& self)
   {
      return Supply{query.sumAmounts(source, data.tokenTypeHash(self, TokenSide::yes)),
                    query.sumAmounts(source, data.tokenTypeHash(self, TokenSide::no))};
   }

   uint128 collateralFor(uint128 completeSets)
   {
      auto result = checkedMultiply<uint128>(completeSets, collateralPerCompleteSet);
      check(result.has_value(), ScriptError::overflow);
      return *result;
   }

   void validateCreation(const ScriptContext& ctx, const MarketCell& output)
   {
      CELLMARKET_LOG(scriptLog(), debug) << "Validating market creation";

      check(!output.data.resolved, MarketError::createdResolved);
      check(!isZero(output.data.tokenCodeHash), MarketError::missingTokenScript);

      auto id = marketId(output.cell);
      check(!ctx.tx.inputs.empty(), ScriptError::itemMissing);
      auto expected = deriveMarketIdentifier(ctx.tx.inputs[0].previousOutput, output.index);
      check(std::equal(id.begin(), id.end(), expected.begin(), expected.end(),
                       [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; }),
            MarketError::invalidTypeId);

      CELLMARKET_LOG(scriptLog(), debug) << "Market created with id " << to_hex(id);
   }

   // Mint and burn move supply and collateral in the same direction by whole
   // complete sets.
   void validateSetChange(const Supply& grow,
                          const Supply& shrink,
                          uint128       collateralChange,
                          const char*   operation)
   {
      check(grow.yes >= shrink.yes && grow.no >= shrink.no, MarketError::supplyDirection);
      auto yes = grow.yes - shrink.yes;
      auto no  = grow.no - shrink.no;
      check(yes == no, MarketError::unequalSupplyChange);
      check(yes > 0, MarketError::emptySupplyChange);
      check(collateralChange == collateralFor(yes), MarketError::insufficientCollateral);
      CELLMARKET_LOG(scriptLog(), debug)
          << operation << " " << to_string(yes) << " complete sets for "
          << to_string(collateralChange);
   }

   void validateOpen(const MarketCell& input,
                     const MarketCell& output,
                     const Supply&     before,
                     const Supply&     after)
   {
      auto inCap  = input.cell.capacity;
      auto outCap = output.cell.capacity;

      if (output.data.resolved)
      {
         CELLMARKET_LOG(scriptLog(), debug) << "Resolution, outcome " << output.data.outcome;
         check(inCap == outCap && before == after, MarketError::resolveWithSupplyChange);
         return;
      }

      check(input.data.outcome == output.data.outcome, MarketError::outcomeChanged);
      if (outCap > inCap)
      {
         validateSetChange(after, before, uint128{outCap - inCap}, "Mint");
      }
      else if (outCap < inCap)
      {
         validateSetChange(before, after, uint128{inCap - outCap}, "Burn");
      }
      else
      {
         check(before == after, MarketError::supplyChangedWithoutCollateral);
      }
   }

   void validateResolved(const MarketCell& input,
                         const MarketCell& output,
                         const Supply&     before,
                         const Supply&     after)
   {
      check(output.data.resolved, MarketError::resolvedFlagChanged);
      check(input.data.outcome == output.data.outcome, MarketError::outcomeChanged);

      auto inCap  = input.cell.capacity;
      auto outCap = output.cell.capacity;
      check(outCap <= inCap, MarketError::collateralAfterResolution);
      if (outCap == inCap)
      {
         check(before == after, MarketError::supplyChangedWithoutCollateral);
         return;
      }

      auto winner = winningSide(input.data.outcome);
      auto loser  = otherSide(winner);
      check(after.side(winner) <= before.side(winner), MarketError::supplyDirection);
      auto burned = before.side(winner) - after.side(winner);
      check(burned > 0, MarketError::nothingClaimed);
      check(after.side(loser) == before.side(loser), MarketError::losingSupplyChanged);
      check(uint128{inCap - outCap} == collateralFor(burned),
            MarketError::insufficientCollateral);

      CELLMARKET_LOG(scriptLog(), debug) << "Claim of " << to_string(burned) << " winning tokens";
   }

   void validateUpdate(const ScriptContext& ctx,
                       const CellQuery&     query,
                       const MarketCell&    input,
                       const MarketCell&    output)
   {
      CELLMARKET_LOG(scriptLog(), debug) << "Validating market transition";

      check(input.cell.lock == output.cell.lock, MarketError::lockScriptChanged);
      check(input.data.tokenCodeHash == output.data.tokenCodeHash &&
                input.data.tokenHashType == output.data.tokenHashType,
            MarketError::tokenScriptChanged);
      // Input and output share the type hash, so the identifier in the args persists

      auto before = loadSupply(query, Source::input, input.data, ctx.scriptHash);
      auto after  = loadSupply(query, Source::output, output.data, ctx.scriptHash);
      CELLMARKET_LOG(scriptLog(), debug)
          << "Supply yes " << to_string(before.yes) << " -> " << to_string(after.yes) << ", no "
          << to_string(before.no) << " -> " << to_string(after.no) << ", capacity "
          << input.cell.capacity << " -> " << output.cell.capacity;

      if (input.data.state() == MarketState::open)
         validateOpen(input, output, before, after);
      else
         validateResolved(input, output, before, after);
   }
}  // namespace

void Market::validate(const ScriptContext& ctx)
{
   CellQuery query{ctx.tx};

   auto inputCount  = query.count(Source::input, ctx.scriptHash);
   auto outputCount = query.count(Source::output, ctx.scriptHash);
   CELLMARKET_LOG(scriptLog(), debug)
       << "Market cells: " << inputCount << " inputs, " << outputCount << " outputs";
   check(outputCount == 1, MarketError::multipleMarketCells);
   check(inputCount <= 1, MarketError::multipleMarketCells);

   auto output = loadMarketCell(query, Source::output, ctx.scriptHash);
   if (inputCount == 0)
   {
      validateCreation(ctx, output);
   }
   else
   {
      auto input = loadMarketCell(query, Source::input, ctx.scriptHash);
      validateUpdate(ctx, query, input, output);
   }
}

std::int8_t Market::verify(const ScriptContext& ctx)
{
   return scriptEntry(name, ctx, &Market::validate);
}
