#include <cellmarket/Cell.hpp>

#include <cellmarket/molecule.hpp>

namespace cellmarket
{
   std::optional<HashType> toHashType(uint8_t value)
   {
      switch (value)
      {
         case 0:
            return HashType::data;
         case 1:
            return HashType::type;
         case 2:
            return HashType::data1;
         case 4:
            return HashType::data2;
      }
      return std::nullopt;
   }

   std::optional<HashType> hashTypeFromName(std::string_view name)
   {
      if (name == "data")
         return HashType::data;
      else if (name == "type")
         return HashType::type;
      else if (name == "data1")
         return HashType::data1;
      else if (name == "data2")
         return HashType::data2;
      return std::nullopt;
   }

   std::string_view hashTypeName(HashType t)
   {
      switch (t)
      {
         case HashType::data:
            return "data";
         case HashType::type:
            return "type";
         case HashType::data1:
            return "data1";
         case HashType::data2:
            return "data2";
      }
      return "unknown";
   }

   Checksum256 Script::hash() const
   {
      return sha256(molecule::pack(*this));
   }

   Checksum256 Transaction::hash() const
   {
      return sha256(molecule::packRaw(*this));
   }
}  // namespace cellmarket
