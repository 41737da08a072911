#include <cellmarket/cellQuery.hpp>

#include <cellmarket/check.hpp>
#include <cellmarket/checked.hpp>
#include <cellmarket/scriptErrors.hpp>

namespace cellmarket
{
   namespace
   {
      void index(std::vector<std::optional<Checksum256>>& types,
                 std::vector<Checksum256>&                locks,
                 const CellOutput&                        cell)
      {
         if (cell.type)
            types.push_back(cell.type->hash());
         else
            types.push_back(std::nullopt);
         locks.push_back(cell.lock.hash());
      }
   }  // namespace

   uint128 readAmount(std::span<const char> data)
   {
      check(data.size() >= 16, ScriptError::lengthNotEnough);
      return readLE<uint128>(data.first(16));
   }

   CellQuery::CellQuery(const Transaction& tx) : tx{tx}
   {
      check(tx.resolvedInputs.size() == tx.inputs.size(), ScriptError::indexOutOfBound);
      check(tx.outputsData.size() == tx.outputs.size(), ScriptError::indexOutOfBound);
      for (const auto& cell : tx.resolvedInputs)
         index(inputs.types, inputs.locks, cell.output);
      for (const auto& cell : tx.outputs)
         index(outputs.types, outputs.locks, cell);
   }

   std::size_t CellQuery::size(Source source) const
   {
      return side(source).locks.size();
   }

   const CellOutput& CellQuery::output(Source source, std::size_t i) const
   {
      check(i < size(source), ScriptError::indexOutOfBound);
      return source == Source::input ? tx.resolvedInputs[i].output : tx.outputs[i];
   }

   const Bytes& CellQuery::data(Source source, std::size_t i) const
   {
      check(i < size(source), ScriptError::indexOutOfBound);
      return source == Source::input ? tx.resolvedInputs[i].data : tx.outputsData[i];
   }

   const std::optional<Checksum256>& CellQuery::typeHash(Source source, std::size_t i) const
   {
      check(i < size(source), ScriptError::indexOutOfBound);
      return side(source).types[i];
   }

   const Checksum256& CellQuery::lockHash(Source source, std::size_t i) const
   {
      check(i < size(source), ScriptError::indexOutOfBound);
      return side(source).locks[i];
   }

   std::size_t CellQuery::count(Source source, const Checksum256& type) const
   {
      std::size_t result = 0;
      for (const auto& t : side(source).types)
         if (t && *t == type)
            ++result;
      return result;
   }

   std::optional<std::size_t> CellQuery::find(Source source, const Checksum256& type) const
   {
      const auto& types = side(source).types;
      for (std::size_t i = 0; i < types.size(); ++i)
         if (types[i] && *types[i] == type)
            return i;
      return std::nullopt;
   }

   std::vector<std::size_t> CellQuery::indices(Source source, const Checksum256& type) const
   {
      std::vector<std::size_t> result;
      const auto&              types = side(source).types;
      for (std::size_t i = 0; i < types.size(); ++i)
         if (types[i] && *types[i] == type)
            result.push_back(i);
      return result;
   }

   uint128 CellQuery::sumAmounts(Source source, const Checksum256& type) const
   {
      uint128 total = 0;
      for (auto i : indices(source, type))
      {
         auto sum = checkedAdd(total, readAmount(data(source, i)));
         check(sum.has_value(), ScriptError::overflow);
         total = *sum;
      }
      return total;
   }

   uint128 CellQuery::sumPlainCapacity(Source source, const Checksum256& lock) const
   {
      uint128     total = 0;
      const auto& s     = side(source);
      for (std::size_t i = 0; i < s.locks.size(); ++i)
      {
         if (s.types[i] || s.locks[i] != lock)
            continue;
         auto sum = checkedAdd<uint128>(total, output(source, i).capacity);
         check(sum.has_value(), ScriptError::overflow);
         total = *sum;
      }
      return total;
   }

   std::size_t CellQuery::countPlain(Source source, const Checksum256& lock) const
   {
      std::size_t result = 0;
      const auto& s      = side(source);
      for (std::size_t i = 0; i < s.locks.size(); ++i)
         if (!s.types[i] && s.locks[i] == lock)
            ++result;
      return result;
   }
}  // namespace cellmarket
