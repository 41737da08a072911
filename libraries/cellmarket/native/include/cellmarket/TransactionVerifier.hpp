#pragma once

#include <cellmarket/ScriptContext.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cellmarket
{
   /// Rejections raised by the verifier itself rather than a program
   enum class VerifyError : std::int8_t
   {
      malformedTransaction = -1,
      unknownTypeScript    = -2,
   };

   std::string_view verifyErrorMessage(VerifyError e);

   /// One execution of a program over the cells sharing a type script
   struct GroupResult
   {
      Checksum256 scriptHash = {};
      Script      script;
      std::string program;
      std::size_t inputs  = 0;
      std::size_t outputs = 0;
      std::int8_t code    = 0;
      bool        skipped = false;
   };

   struct VerifyResult
   {
      std::vector<GroupResult> groups;
      std::int8_t              code = 0;

      bool accepted() const { return code == 0; }
   };

   /// Runs the registered type script programs over a transaction
   ///
   /// Each distinct type script is executed once, no matter how many input
   /// and output cells carry it. Lock scripts are not executed.
   class TransactionVerifier
   {
     public:
      explicit TransactionVerifier(bool strictTypes = true) : strictTypes{strictTypes} {}

      /// Registers `program` for type scripts with this code hash and hash
      /// type. Replaces an earlier registration.
      void add(const Checksum256& codeHash,
               HashType           hashType,
               std::string        name,
               ScriptProgram      program);

      bool registered(const Script& script) const;

      VerifyResult verify(const Transaction& tx) const;

     private:
      struct Program
      {
         std::string   name;
         ScriptProgram run;
      };
      using Key = std::pair<Checksum256, HashType>;

      std::map<Key, Program> programs;
      bool                   strictTypes;
   };
}  // namespace cellmarket
