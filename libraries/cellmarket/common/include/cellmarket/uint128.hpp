#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace cellmarket
{
   using uint128 = unsigned __int128;

   // Little-endian fixed width fields. The caller guarantees the span is long enough.
   template <typename T>
   T readLE(std::span<const char> data)
   {
      T result = 0;
      for (std::size_t i = sizeof(T); i-- > 0;)
         result = (result << 8) | static_cast<uint8_t>(data[i]);
      return result;
   }

   template <typename T>
   void writeLE(T value, std::vector<char>& out)
   {
      for (std::size_t i = 0; i < sizeof(T); ++i)
      {
         out.push_back(static_cast<char>(static_cast<uint8_t>(value)));
         value >>= 8;
      }
   }

   std::string to_string(uint128 value);
}  // namespace cellmarket
