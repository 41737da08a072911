#define OPENSSL_SUPPRESS_DEPRECATED

#include <cellmarket/crypto.hpp>

#include <openssl/sha.h>
#include <cstring>

namespace cellmarket
{
   Checksum256 sha256(const char* data, size_t length)
   {
      SHA256_CTX ctx;
      SHA256_Init(&ctx);
      SHA256_Update(&ctx, (const unsigned char*)data, length);
      Checksum256 result;
      SHA256_Final((unsigned char*)result.data(), &ctx);
      return result;
   }

   struct Sha256::Impl
   {
      SHA256_CTX ctx;
   };

   Sha256::Sha256() : impl(new Impl)
   {
      SHA256_Init(&impl->ctx);
   }

   Sha256::~Sha256() = default;

   Sha256& Sha256::update(const void* data, size_t length)
   {
      SHA256_Update(&impl->ctx, data, length);
      return *this;
   }

   Checksum256 Sha256::final()
   {
      Checksum256 result;
      SHA256_Final(result.data(), &impl->ctx);
      return result;
   }

   std::string to_hex(std::span<const char> bytes)
   {
      static constexpr char digits[] = "0123456789abcdef";
      std::string           s;
      s.reserve(bytes.size() * 2);
      for (char ch : bytes)
      {
         auto b = static_cast<uint8_t>(ch);
         s.push_back(digits[b >> 4]);
         s.push_back(digits[b & 0xf]);
      }
      return s;
   }

   std::string to_hex(const Checksum256& c)
   {
      return to_hex(std::span{reinterpret_cast<const char*>(c.data()), c.size()});
   }

   bool from_hex(std::string_view h, std::vector<char>& bytes)
   {
      if (h.starts_with("0x") || h.starts_with("0X"))
         h.remove_prefix(2);
      if (h.size() % 2)
         return false;
      bytes.resize(h.size() / 2);
      auto dest = bytes.begin();

      auto begin     = h.begin();
      auto end       = h.end();
      auto get_digit = [&](std::uint8_t& nibble)
      {
         if (*begin >= '0' && *begin <= '9')
            nibble = *begin++ - '0';
         else if (*begin >= 'a' && *begin <= 'f')
            nibble = *begin++ - 'a' + 10;
         else if (*begin >= 'A' && *begin <= 'F')
            nibble = *begin++ - 'A' + 10;
         else
            return false;
         return true;
      };
      while (begin != end)
      {
         std::uint8_t h, l;
         if (!get_digit(h) || !get_digit(l))
            return false;
         *dest++ = (h << 4) | l;
      }
      return true;
   }

   bool from_hex(std::string_view h, Checksum256& c)
   {
      std::vector<char> bytes;
      if (!from_hex(h, bytes) || bytes.size() != c.size())
         return false;
      std::memcpy(c.data(), bytes.data(), c.size());
      return true;
   }
}  // namespace cellmarket
