#include <services/script/marketErrors.hpp>

#include <string>

namespace ScriptService
{
   namespace
   {
      class market_error_category : public std::error_category
      {
         virtual const char* name() const noexcept override { return "market"; }
         virtual std::string message(int condition) const override
         {
            switch (MarketError(condition))
            {
               case MarketError::invalidMarketArgs:
                  return "Market type args must be a 32 byte identifier";
               case MarketError::multipleMarketCells:
                  return "Transaction must have exactly one market cell in outputs and at most "
                         "one in inputs";
               case MarketError::supplyDirection:
                  return "Token supply moved against the collateral change";
               case MarketError::unequalSupplyChange:
                  return "YES and NO supply must change by the same amount";
               case MarketError::insufficientCollateral:
                  return "Collateral change does not match complete sets";
               case MarketError::lockScriptChanged:
                  return "Market lock script changed";
               case MarketError::invalidTypeId:
                  return "Market identifier does not match the first input";
               case MarketError::tokenScriptChanged:
                  return "Token code hash or hash type changed";
               case MarketError::missingTokenScript:
                  return "Token code hash must not be zero";
               case MarketError::createdResolved:
                  return "Market cannot be resolved at creation";
               case MarketError::resolvedFlagChanged:
                  return "Resolved flag may only change from false to true";
               case MarketError::outcomeChanged:
                  return "Outcome cannot change";
               case MarketError::supplyChangedWithoutCollateral:
                  return "Token supply changed without a collateral change";
               case MarketError::resolveWithSupplyChange:
                  return "Resolution cannot change supply or collateral";
               case MarketError::emptySupplyChange:
                  return "Collateral changed without minting or burning complete sets";
               case MarketError::losingSupplyChanged:
                  return "Losing token supply changed during claim";
               case MarketError::nothingClaimed:
                  return "Claim must burn winning tokens";
               case MarketError::collateralAfterResolution:
                  return "Collateral cannot increase after resolution";
            }
            if (condition < static_cast<int>(MarketError::invalidMarketArgs))
               return cellmarket::scriptCategory().message(condition);
            return "unknown market error " + std::to_string(condition);
         }
      };
   }  // namespace

   const std::error_category& marketCategory()
   {
      static const market_error_category result;
      return result;
   }

   std::error_code make_error_code(MarketError e)
   {
      return std::error_code(static_cast<int>(e), marketCategory());
   }
}  // namespace ScriptService
