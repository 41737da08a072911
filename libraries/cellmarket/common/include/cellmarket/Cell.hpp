#pragma once

#include <cellmarket/crypto.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cellmarket
{
   using Bytes = std::vector<char>;

   /// How a script's `codeHash` is matched against deployed code
   enum class HashType : uint8_t
   {
      data  = 0,  ///< codeHash is the hash of the code cell's data
      type  = 1,  ///< codeHash is the type script hash of the code cell
      data1 = 2,  ///< data, executed by VM version 1
      data2 = 4,  ///< data, executed by VM version 2
   };

   std::optional<HashType> toHashType(uint8_t value);
   std::optional<HashType> hashTypeFromName(std::string_view name);
   std::string_view        hashTypeName(HashType t);

   /// A predicate: the ownership (lock) or asset class (type) of a cell
   ///
   /// Two scripts are equal iff all three fields are byte-for-byte equal.
   struct Script
   {
      Checksum256 codeHash = {};
      HashType    hashType = HashType::data;
      Bytes       args;

      /// Content hash of the serialized script. Cells are grouped and
      /// recognized by this value.
      Checksum256 hash() const;

      friend bool operator==(const Script&, const Script&) = default;
   };

   /// Reference to a cell created by an earlier transaction
   struct OutPoint
   {
      Checksum256   txHash = {};
      std::uint32_t index  = 0;

      friend bool operator==(const OutPoint&, const OutPoint&) = default;
   };

   struct CellInput
   {
      std::uint64_t since = 0;
      OutPoint      previousOutput;

      friend bool operator==(const CellInput&, const CellInput&) = default;
   };

   struct CellOutput
   {
      std::uint64_t         capacity = 0;
      Script                lock;
      std::optional<Script> type;

      friend bool operator==(const CellOutput&, const CellOutput&) = default;
   };

   /// A consumed cell as the ledger resolved it
   struct ResolvedCell
   {
      CellOutput output;
      Bytes      data;

      friend bool operator==(const ResolvedCell&, const ResolvedCell&) = default;
   };

   /// A candidate transaction
   ///
   /// `resolvedInputs[i]` is the cell referenced by `inputs[i]` and
   /// `outputsData[i]` is the payload of `outputs[i]`.
   struct Transaction
   {
      std::vector<CellInput>    inputs;
      std::vector<ResolvedCell> resolvedInputs;
      std::vector<CellOutput>   outputs;
      std::vector<Bytes>        outputsData;

      /// Hash of inputs, outputs and outputsData. Resolved inputs are
      /// excluded since they are implied by the out points.
      Checksum256 hash() const;

      friend bool operator==(const Transaction&, const Transaction&) = default;
   };
}  // namespace cellmarket
