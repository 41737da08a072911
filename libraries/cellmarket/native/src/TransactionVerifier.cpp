#include <cellmarket/TransactionVerifier.hpp>

#include <cellmarket/log.hpp>

#include <algorithm>

namespace cellmarket
{
   namespace
   {
      struct Group
      {
         Checksum256 hash;
         Script      script;
         std::size_t inputs  = 0;
         std::size_t outputs = 0;
      };

      // In order of first appearance: inputs, then outputs
      std::vector<Group> groupTypes(const Transaction& tx)
      {
         std::vector<Group> result;
         auto               add = [&](const CellOutput& cell, bool input)
         {
            if (!cell.type)
               return;
            auto hash = cell.type->hash();
            auto pos  = std::find_if(result.begin(), result.end(),
                                     [&](const Group& g) { return g.hash == hash; });
            if (pos == result.end())
               pos = result.insert(result.end(), Group{hash, *cell.type});
            ++(input ? pos->inputs : pos->outputs);
         };
         for (const auto& cell : tx.resolvedInputs)
            add(cell.output, true);
         for (const auto& cell : tx.outputs)
            add(cell, false);
         return result;
      }

      void reject(VerifyResult& result, std::int8_t code)
      {
         if (result.code == 0)
            result.code = code;
      }
   }  // namespace

   std::string_view verifyErrorMessage(VerifyError e)
   {
      switch (e)
      {
         case VerifyError::malformedTransaction:
            return "inputs or outputs do not match their resolved cells or data";
         case VerifyError::unknownTypeScript:
            return "type script is not registered";
      }
      return "unknown error";
   }

   void TransactionVerifier::add(const Checksum256& codeHash,
                                 HashType           hashType,
                                 std::string        name,
                                 ScriptProgram      program)
   {
      programs[Key{codeHash, hashType}] = Program{std::move(name), program};
   }

   bool TransactionVerifier::registered(const Script& script) const
   {
      return programs.find(Key{script.codeHash, script.hashType}) != programs.end();
   }

   VerifyResult TransactionVerifier::verify(const Transaction& tx) const
   {
      auto&        logger = loggers::verifier::get();
      VerifyResult result;
      if (tx.inputs.size() != tx.resolvedInputs.size() ||
          tx.outputs.size() != tx.outputsData.size())
      {
         CELLMARKET_LOG(logger, warning)
             << "malformed transaction: " << tx.inputs.size() << " inputs, "
             << tx.resolvedInputs.size() << " resolved, " << tx.outputs.size() << " outputs, "
             << tx.outputsData.size() << " data";
         result.code = static_cast<std::int8_t>(VerifyError::malformedTransaction);
         return result;
      }

      for (auto& group : groupTypes(tx))
      {
         GroupResult gr{.scriptHash = group.hash,
                        .script     = std::move(group.script),
                        .inputs     = group.inputs,
                        .outputs    = group.outputs};
         auto        hash = to_hex(gr.scriptHash);
         auto        pos  = programs.find(Key{gr.script.codeHash, gr.script.hashType});
         if (pos == programs.end())
         {
            if (strictTypes)
            {
               CELLMARKET_LOG_SCRIPT(logger, warning, hash)
                   << verifyErrorMessage(VerifyError::unknownTypeScript);
               gr.code = static_cast<std::int8_t>(VerifyError::unknownTypeScript);
               reject(result, gr.code);
            }
            else
            {
               CELLMARKET_LOG_SCRIPT(logger, warning, hash) << "skipping unregistered type script";
               gr.skipped = true;
            }
            result.groups.push_back(std::move(gr));
            continue;
         }

         gr.program = pos->second.name;
         CELLMARKET_LOG_SCRIPT(logger, debug, hash)
             << "running " << gr.program << " over " << gr.inputs << " inputs and " << gr.outputs
             << " outputs";
         gr.code = pos->second.run(ScriptContext{tx, gr.script});
         reject(result, gr.code);
         result.groups.push_back(std::move(gr));
      }

      if (result.accepted())
         CELLMARKET_LOG(logger, info) << "transaction " << to_hex(tx.hash()) << " accepted";
      else
         CELLMARKET_LOG(logger, info) << "transaction " << to_hex(tx.hash()) << " rejected ("
                                      << static_cast<int>(result.code) << ")";
      return result;
   }
}  // namespace cellmarket
