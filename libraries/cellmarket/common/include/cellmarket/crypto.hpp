#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cellmarket
{
   using Checksum256 = std::array<uint8_t, 32>;

   Checksum256 sha256(const char* data, size_t length);

   inline Checksum256 sha256(const unsigned char* data, size_t length)
   {
      return sha256(reinterpret_cast<const char*>(data), length);
   }

   inline Checksum256 sha256(std::span<const char> data)
   {
      return sha256(data.data(), data.size());
   }

   // Incremental hasher for values that are built from several pieces
   class Sha256
   {
     public:
      Sha256();
      ~Sha256();
      Sha256(const Sha256&)            = delete;
      Sha256& operator=(const Sha256&) = delete;

      Sha256&     update(const void* data, size_t length);
      Sha256&     update(std::span<const char> data) { return update(data.data(), data.size()); }
      Checksum256 final();

     private:
      struct Impl;
      std::unique_ptr<Impl> impl;
   };

   inline bool isZero(const Checksum256& c)
   {
      for (auto b : c)
         if (b)
            return false;
      return true;
   }

   std::string to_hex(std::span<const char> bytes);
   std::string to_hex(const Checksum256& c);

   // Accepts an optional 0x prefix. Returns false on odd length or a bad digit.
   bool from_hex(std::string_view h, std::vector<char>& bytes);
   bool from_hex(std::string_view h, Checksum256& c);
}  // namespace cellmarket
