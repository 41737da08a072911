#pragma once

#include <cellmarket/scriptErrors.hpp>

#include <cstdint>
#include <system_error>

namespace ScriptService
{
   // Codes 1-5 are cellmarket::ScriptError
   enum class MarketError : std::int8_t
   {
      invalidMarketArgs              = 10,
      multipleMarketCells            = 11,
      supplyDirection                = 12,
      unequalSupplyChange            = 13,
      insufficientCollateral         = 14,
      lockScriptChanged              = 15,
      invalidTypeId                  = 16,
      tokenScriptChanged             = 18,
      missingTokenScript             = 19,
      createdResolved                = 20,
      resolvedFlagChanged            = 21,
      outcomeChanged                 = 22,
      supplyChangedWithoutCollateral = 23,
      resolveWithSupplyChange        = 24,
      emptySupplyChange              = 25,
      losingSupplyChanged            = 26,
      nothingClaimed                 = 27,
      collateralAfterResolution      = 28,
   };

   const std::error_category& marketCategory();
   std::error_code            make_error_code(MarketError e);
}  // namespace ScriptService

namespace std
{
   template <>
   struct is_error_code_enum<::ScriptService::MarketError>
   {
      static constexpr bool value = true;
   };
}  // namespace std
