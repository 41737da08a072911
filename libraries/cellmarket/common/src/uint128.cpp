#include <cellmarket/uint128.hpp>

#include <algorithm>

namespace cellmarket
{
   std::string to_string(uint128 value)
   {
      if (value == 0)
         return "0";
      std::string result;
      while (value != 0)
      {
         result.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
         value /= 10;
      }
      std::reverse(result.begin(), result.end());
      return result;
   }
}  // namespace cellmarket
