#include <services/script/marketTypes.hpp>

#include <cellmarket/check.hpp>
#include <cellmarket/scriptErrors.hpp>

#include <cstring>

using namespace cellmarket;

namespace ScriptService
{
   namespace
   {
      bool readBool(char ch)
      {
         check(ch == 0 || ch == 1, ScriptError::encoding);
         return ch == 1;
      }
   }  // namespace

   MarketData MarketData::unpack(std::span<const char> data)
   {
      check(data.size() >= size, ScriptError::lengthNotEnough);
      MarketData result;
      std::memcpy(result.tokenCodeHash.data(), data.data(), result.tokenCodeHash.size());
      auto hashType = toHashType(static_cast<uint8_t>(data[32]));
      check(hashType.has_value(), ScriptError::encoding);
      result.tokenHashType = *hashType;
      result.resolved      = readBool(data[33]);
      result.outcome       = readBool(data[34]);
      return result;
   }

   Bytes MarketData::pack() const
   {
      Bytes result(tokenCodeHash.begin(), tokenCodeHash.end());
      result.push_back(static_cast<char>(tokenHashType));
      result.push_back(resolved ? 1 : 0);
      result.push_back(outcome ? 1 : 0);
      return result;
   }
}  // namespace ScriptService
