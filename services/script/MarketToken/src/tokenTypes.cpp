#include <services/script/tokenTypes.hpp>

#include <cellmarket/cellQuery.hpp>
#include <cellmarket/check.hpp>
#include <cellmarket/scriptErrors.hpp>
#include <services/script/tokenErrors.hpp>

#include <cstring>

using namespace cellmarket;

namespace ScriptService
{
   TokenData TokenData::unpack(std::span<const char> data)
   {
      TokenData result;
      result.amount = readAmount(data);
      if (data.size() >= size)
         result.limitPrice = readLE<uint128>(data.subspan(legacySize, 16));
      return result;
   }

   Bytes TokenData::pack() const
   {
      Bytes result;
      writeLE(amount, result);
      writeLE(limitPrice, result);
      return result;
   }

   TokenArgs TokenArgs::unpack(std::span<const char> args)
   {
      check(args.size() >= tokenArgsSize, TokenError::invalidTokenArgs);
      TokenArgs result;
      std::memcpy(result.marketTypeHash.data(), args.data(), result.marketTypeHash.size());
      auto side = toTokenSide(static_cast<uint8_t>(args[32]));
      check(side.has_value(), TokenError::invalidTokenArgs);
      result.side = *side;
      return result;
   }
}  // namespace ScriptService
