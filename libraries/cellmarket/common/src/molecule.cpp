#include <cellmarket/molecule.hpp>

#include <cellmarket/check.hpp>
#include <cellmarket/uint128.hpp>

#include <cstring>
#include <string>

namespace cellmarket::molecule
{
   namespace
   {
      using Span = std::span<const char>;

      void append(Bytes& out, Span data)
      {
         out.insert(out.end(), data.begin(), data.end());
      }

      Bytes bytes(Span data)
      {
         Bytes result;
         writeLE<std::uint32_t>(data.size(), result);
         append(result, data);
         return result;
      }

      Bytes table(const std::vector<Bytes>& fields)
      {
         std::size_t header = 4 * (1 + fields.size());
         std::size_t total  = header;
         for (const auto& f : fields)
            total += f.size();
         check(total <= UINT32_MAX, "molecule table too large");

         Bytes result;
         result.reserve(total);
         writeLE<std::uint32_t>(total, result);
         std::size_t offset = header;
         for (const auto& f : fields)
         {
            writeLE<std::uint32_t>(offset, result);
            offset += f.size();
         }
         for (const auto& f : fields)
            append(result, f);
         return result;
      }

      template <typename T>
      Bytes dynvec(const std::vector<T>& items)
      {
         std::vector<Bytes> packed;
         packed.reserve(items.size());
         for (const auto& item : items)
            packed.push_back(pack(item));
         return table(packed);
      }

      Bytes dynvec(const std::vector<Bytes>& items)
      {
         std::vector<Bytes> packed;
         packed.reserve(items.size());
         for (const auto& item : items)
            packed.push_back(bytes(item));
         return table(packed);
      }

      std::uint32_t readU32(Span data, std::string_view what)
      {
         check(data.size() >= 4, std::string(what) + ": truncated");
         return readLE<std::uint32_t>(data);
      }

      // Returns the spans of each field. If `expected` is set, the field count must match.
      std::vector<Span> readTable(Span                       data,
                                  std::string_view           what,
                                  std::optional<std::size_t> expected)
      {
         auto total = readU32(data, what);
         check(total == data.size(), std::string(what) + ": size mismatch");
         std::vector<Span> fields;
         if (total == 4)
         {
            check(!expected || *expected == 0, std::string(what) + ": missing fields");
            return fields;
         }
         auto first = readU32(data.subspan(4), what);
         check(first >= 8 && first % 4 == 0 && first <= total,
               std::string(what) + ": invalid header");
         std::size_t count = first / 4 - 1;
         check(!expected || *expected == count, std::string(what) + ": wrong field count");
         std::vector<std::uint32_t> offsets;
         for (std::size_t i = 0; i < count; ++i)
            offsets.push_back(readU32(data.subspan(4 + 4 * i), what));
         offsets.push_back(total);
         for (std::size_t i = 0; i < count; ++i)
         {
            check(offsets[i] <= offsets[i + 1] && offsets[i] >= first,
                  std::string(what) + ": invalid offset");
            fields.push_back(data.subspan(offsets[i], offsets[i + 1] - offsets[i]));
         }
         return fields;
      }

      Bytes readBytes(Span data, std::string_view what)
      {
         auto len = readU32(data, what);
         check(data.size() == 4 + std::size_t{len}, std::string(what) + ": size mismatch");
         return Bytes(data.begin() + 4, data.end());
      }

      Checksum256 readHash(Span data)
      {
         Checksum256 result;
         std::memcpy(result.data(), data.data(), result.size());
         return result;
      }

      ResolvedCell unpackResolvedCell(Span data)
      {
         auto fields = readTable(data, "ResolvedCell", 2);
         return ResolvedCell{unpackCellOutput(fields[0]),
                             readBytes(fields[1], "ResolvedCell.data")};
      }
   }  // namespace

   Bytes pack(const Script& script)
   {
      return table({Bytes(script.codeHash.begin(), script.codeHash.end()),
                    Bytes{static_cast<char>(script.hashType)}, bytes(script.args)});
   }

   Bytes pack(const OutPoint& outPoint)
   {
      Bytes result(outPoint.txHash.begin(), outPoint.txHash.end());
      writeLE(outPoint.index, result);
      return result;
   }

   Bytes pack(const CellInput& input)
   {
      Bytes result;
      writeLE(input.since, result);
      append(result, pack(input.previousOutput));
      return result;
   }

   Bytes pack(const ResolvedCell& cell)
   {
      return table({pack(cell.output), bytes(cell.data)});
   }

   Bytes pack(const CellOutput& output)
   {
      Bytes capacity;
      writeLE(output.capacity, capacity);
      return table({capacity, pack(output.lock), output.type ? pack(*output.type) : Bytes{}});
   }

   Bytes packRaw(const Transaction& tx)
   {
      Bytes inputs;
      writeLE<std::uint32_t>(tx.inputs.size(), inputs);
      for (const auto& input : tx.inputs)
         append(inputs, pack(input));
      return table({inputs, dynvec(tx.outputs), dynvec(tx.outputsData)});
   }

   Bytes pack(const Transaction& tx)
   {
      auto raw = packRaw(tx);
      return table({raw, dynvec(tx.resolvedInputs)});
   }

   Script unpackScript(std::span<const char> data)
   {
      auto fields = readTable(data, "Script", 3);
      check(fields[0].size() == 32, "Script.codeHash: size mismatch");
      check(fields[1].size() == 1, "Script.hashType: size mismatch");
      auto hashType = toHashType(static_cast<uint8_t>(fields[1][0]));
      check(hashType.has_value(), "Script.hashType: invalid value");
      return Script{readHash(fields[0]), *hashType, readBytes(fields[2], "Script.args")};
   }

   OutPoint unpackOutPoint(std::span<const char> data)
   {
      check(data.size() == outPointSize, "OutPoint: size mismatch");
      return OutPoint{readHash(data), readLE<std::uint32_t>(data.subspan(32))};
   }

   CellInput unpackCellInput(std::span<const char> data)
   {
      check(data.size() == cellInputSize, "CellInput: size mismatch");
      return CellInput{readLE<std::uint64_t>(data), unpackOutPoint(data.subspan(8))};
   }

   CellOutput unpackCellOutput(std::span<const char> data)
   {
      auto fields = readTable(data, "CellOutput", 3);
      check(fields[0].size() == 8, "CellOutput.capacity: size mismatch");
      CellOutput result;
      result.capacity = readLE<std::uint64_t>(fields[0]);
      result.lock     = unpackScript(fields[1]);
      if (!fields[2].empty())
         result.type = unpackScript(fields[2]);
      return result;
   }

   Transaction unpackTransaction(std::span<const char> data)
   {
      auto        outer = readTable(data, "Transaction", 2);
      auto        raw   = readTable(outer[0], "RawTransaction", 3);
      Transaction tx;

      auto count = readU32(raw[0], "Transaction.inputs");
      check(raw[0].size() == 4 + std::size_t{count} * cellInputSize,
            "Transaction.inputs: size mismatch");
      for (std::size_t i = 0; i < count; ++i)
         tx.inputs.push_back(unpackCellInput(raw[0].subspan(4 + i * cellInputSize, cellInputSize)));

      for (auto item : readTable(raw[1], "Transaction.outputs", std::nullopt))
         tx.outputs.push_back(unpackCellOutput(item));
      for (auto item : readTable(raw[2], "Transaction.outputsData", std::nullopt))
         tx.outputsData.push_back(readBytes(item, "Transaction.outputsData"));
      for (auto item : readTable(outer[1], "Transaction.resolvedInputs", std::nullopt))
         tx.resolvedInputs.push_back(unpackResolvedCell(item));
      return tx;
   }
}  // namespace cellmarket::molecule
