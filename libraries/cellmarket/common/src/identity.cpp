#include <cellmarket/identity.hpp>

#include <cellmarket/molecule.hpp>
#include <cellmarket/uint128.hpp>

namespace cellmarket
{
   std::optional<TokenSide> toTokenSide(uint8_t value)
   {
      switch (value)
      {
         case 0x01:
            return TokenSide::yes;
         case 0x02:
            return TokenSide::no;
      }
      return std::nullopt;
   }

   Bytes tokenArgs(const Checksum256& marketTypeHash, TokenSide side)
   {
      Bytes result(marketTypeHash.begin(), marketTypeHash.end());
      result.push_back(static_cast<char>(side));
      return result;
   }

   Script tokenScript(const Checksum256& tokenCodeHash,
                      HashType           tokenHashType,
                      const Checksum256& marketTypeHash,
                      TokenSide          side)
   {
      return Script{tokenCodeHash, tokenHashType, tokenArgs(marketTypeHash, side)};
   }

   Checksum256 deriveTokenIdentity(const Checksum256& tokenCodeHash,
                                   HashType           tokenHashType,
                                   const Checksum256& marketTypeHash,
                                   TokenSide          side)
   {
      return tokenScript(tokenCodeHash, tokenHashType, marketTypeHash, side).hash();
   }

   Checksum256 deriveMarketIdentifier(const OutPoint& firstInput, std::uint64_t outputIndex)
   {
      Bytes index;
      writeLE(outputIndex, index);
      return Sha256{}.update(molecule::pack(firstInput)).update(index).final();
   }
}  // namespace cellmarket
