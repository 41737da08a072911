#pragma once

#include <cellmarket/Cell.hpp>

#include <span>

// Binary layouts of the ledger types.
//
// struct:  fields back to back, fixed size
// fixvec:  u32 item count, items
// table:   u32 total size, u32 offset per field, fields
// dynvec:  same header as a table, one offset per item
// option:  empty, or the inner value
//
// All integers are little-endian. Unpacking raises std::runtime_error.
namespace cellmarket::molecule
{
   constexpr std::size_t outPointSize  = 36;
   constexpr std::size_t cellInputSize = 44;

   Bytes pack(const Script& script);
   Bytes pack(const OutPoint& outPoint);
   Bytes pack(const CellInput& input);
   Bytes pack(const CellOutput& output);
   Bytes pack(const ResolvedCell& cell);
   Bytes pack(const Transaction& tx);

   // The transaction without resolvedInputs. Input to Transaction::hash().
   Bytes packRaw(const Transaction& tx);

   Script      unpackScript(std::span<const char> data);
   OutPoint    unpackOutPoint(std::span<const char> data);
   CellInput   unpackCellInput(std::span<const char> data);
   CellOutput  unpackCellOutput(std::span<const char> data);
   Transaction unpackTransaction(std::span<const char> data);
}  // namespace cellmarket::molecule
