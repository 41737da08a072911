#pragma once

#include <cellmarket/Cell.hpp>
#include <cellmarket/identity.hpp>
#include <cellmarket/uint128.hpp>

#include <span>

namespace ScriptService
{
   /// Payload of a YES or NO token cell
   ///
   /// Layout: amount(16, LE) ∥ limitPrice(16, LE). Data shorter than 32
   /// bytes is the legacy form, which carries only the amount and is never
   /// an order.
   struct TokenData
   {
      static constexpr std::size_t legacySize = 16;
      static constexpr std::size_t size       = 32;

      cellmarket::uint128 amount     = 0;
      cellmarket::uint128 limitPrice = 0;

      /// Aborts with ScriptError::lengthNotEnough
      static TokenData  unpack(std::span<const char> data);
      cellmarket::Bytes pack() const;

      /// An open limit order: spendable by anyone who pays the seller
      bool isOrder() const { return limitPrice > 0; }

      friend bool operator==(const TokenData&, const TokenData&) = default;
   };

   /// Token type script args: marketTypeHash(32) ∥ side(1)
   struct TokenArgs
   {
      cellmarket::Checksum256 marketTypeHash = {};
      cellmarket::TokenSide   side           = cellmarket::TokenSide::yes;

      /// Aborts with TokenError::invalidTokenArgs
      static TokenArgs unpack(std::span<const char> args);
   };
}  // namespace ScriptService
