#pragma once

#include <cellmarket/Cell.hpp>
#include <cellmarket/uint128.hpp>

#include <optional>
#include <span>
#include <vector>

namespace cellmarket
{
   enum class Source
   {
      input,
      output,
   };

   /// Leading 16 bytes of a token cell's data, as a little-endian amount
   ///
   /// Aborts with ScriptError::lengthNotEnough if the data is shorter.
   uint128 readAmount(std::span<const char> data);

   /// Read-only index over a transaction's cells
   ///
   /// Type and lock hashes are computed once at construction. Lookups that
   /// take a type hash only consider cells whose type script hashes to it;
   /// "plain" lookups only consider cells without a type script.
   class CellQuery
   {
     public:
      explicit CellQuery(const Transaction& tx);

      std::size_t                       size(Source source) const;
      const CellOutput&                 output(Source source, std::size_t i) const;
      const Bytes&                      data(Source source, std::size_t i) const;
      const std::optional<Checksum256>& typeHash(Source source, std::size_t i) const;
      const Checksum256&                lockHash(Source source, std::size_t i) const;

      bool hasType(Source source, std::size_t i, const Checksum256& type) const
      {
         const auto& t = typeHash(source, i);
         return t && *t == type;
      }

      std::size_t                count(Source source, const Checksum256& type) const;
      std::optional<std::size_t> find(Source source, const Checksum256& type) const;
      std::vector<std::size_t>   indices(Source source, const Checksum256& type) const;

      /// Sum of token amounts. Aborts on short data or overflow.
      uint128 sumAmounts(Source source, const Checksum256& type) const;

      /// Sum of capacities of plain cells locked by `lock`
      uint128     sumPlainCapacity(Source source, const Checksum256& lock) const;
      std::size_t countPlain(Source source, const Checksum256& lock) const;

     private:
      struct Side
      {
         std::vector<std::optional<Checksum256>> types;
         std::vector<Checksum256>                locks;
      };

      const Side& side(Source source) const
      {
         return source == Source::input ? inputs : outputs;
      }

      const Transaction& tx;
      Side               inputs;
      Side               outputs;
   };
}  // namespace cellmarket
