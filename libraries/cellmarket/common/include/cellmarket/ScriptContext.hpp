#pragma once

#include <cellmarket/Cell.hpp>

#include <cstdint>
#include <utility>

namespace cellmarket
{
   /// What a validation program sees when it runs
   ///
   /// The program is a pure function of this context. `scriptHash` is the
   /// hash of `script`, the type script whose group is being validated;
   /// cells belonging to the group are the cells whose type hash equals it.
   struct ScriptContext
   {
      const Transaction& tx;
      Script             script;
      Checksum256        scriptHash;

      ScriptContext(const Transaction& tx, Script script)
          : tx{tx}, script{std::move(script)}, scriptHash{this->script.hash()}
      {
      }
   };

   /// Entry point of a validation program: 0 accepts, anything else rejects
   using ScriptProgram = std::int8_t (*)(const ScriptContext&);
}  // namespace cellmarket
