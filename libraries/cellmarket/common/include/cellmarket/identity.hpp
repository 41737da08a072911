#pragma once

#include <cellmarket/Cell.hpp>

#include <cstdint>
#include <optional>

namespace cellmarket
{
   /// Which outcome a market token pays out on
   enum class TokenSide : uint8_t
   {
      yes = 0x01,
      no  = 0x02,
   };

   std::optional<TokenSide> toTokenSide(uint8_t value);

   constexpr TokenSide winningSide(bool outcome)
   {
      return outcome ? TokenSide::yes : TokenSide::no;
   }

   constexpr TokenSide otherSide(TokenSide side)
   {
      return side == TokenSide::yes ? TokenSide::no : TokenSide::yes;
   }

   /// Token script args: `marketTypeHash ∥ side`
   constexpr std::size_t tokenArgsSize = 33;

   Bytes  tokenArgs(const Checksum256& marketTypeHash, TokenSide side);
   Script tokenScript(const Checksum256& tokenCodeHash,
                      HashType           tokenHashType,
                      const Checksum256& marketTypeHash,
                      TokenSide          side);

   /// The type hash a token cell of `side` must carry to belong to the
   /// market whose type hash is `marketTypeHash`
   ///
   /// The args layout must match the one used to create the token cells,
   /// otherwise the market's aggregation silently sees no tokens.
   Checksum256 deriveTokenIdentity(const Checksum256& tokenCodeHash,
                                   HashType           tokenHashType,
                                   const Checksum256& marketTypeHash,
                                   TokenSide          side);

   /// Type ID: hash(firstInput ∥ u64 LE outputIndex)
   ///
   /// Unique because an out point can be consumed only once.
   Checksum256 deriveMarketIdentifier(const OutPoint& firstInput, std::uint64_t outputIndex);
}  // namespace cellmarket
