#pragma once

#include <cellmarket/Cell.hpp>
#include <cellmarket/identity.hpp>

#include <cstdint>
#include <span>

namespace ScriptService
{
   /// Capacity locked per complete set (one YES + one NO): 100 units of 10^8
   constexpr std::uint64_t collateralPerCompleteSet = 10'000'000'000;

   /// Market type script args hold only the market identifier
   constexpr std::size_t marketIdSize = 32;

   enum class MarketState
   {
      open,
      resolved,
   };

   /// Payload of the market cell
   ///
   /// Layout: tokenCodeHash(32) ∥ tokenHashType(1) ∥ resolved(1) ∥ outcome(1).
   /// Booleans are 0 or 1; anything else is an encoding error.
   struct MarketData
   {
      static constexpr std::size_t size = 35;

      cellmarket::Checksum256 tokenCodeHash = {};
      cellmarket::HashType    tokenHashType = cellmarket::HashType::data;
      bool                    resolved      = false;
      bool                    outcome       = false;

      /// Aborts with ScriptError::lengthNotEnough or ScriptError::encoding
      static MarketData unpack(std::span<const char> data);
      cellmarket::Bytes pack() const;

      MarketState state() const { return resolved ? MarketState::resolved : MarketState::open; }

      /// Type hash of this market's tokens on `side`
      cellmarket::Checksum256 tokenTypeHash(const cellmarket::Checksum256& marketTypeHash,
                                            cellmarket::TokenSide          side) const
      {
         return cellmarket::deriveTokenIdentity(tokenCodeHash, tokenHashType, marketTypeHash,
                                                side);
      }

      friend bool operator==(const MarketData&, const MarketData&) = default;
   };
}  // namespace ScriptService
