#pragma once

#include <cellmarket/Cell.hpp>

#include <boost/any.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace cellmarket
{
   /// Which deployed scripts are the market and token programs
   ///
   /// A zero code hash means the program is not deployed and is not
   /// registered with the verifier.
   struct VerifierConfig
   {
      Checksum256 marketCodeHash = {};
      HashType    marketHashType = HashType::data2;
      Checksum256 tokenCodeHash  = {};
      HashType    tokenHashType  = HashType::data2;
      bool        strictTypes    = true;
   };

   /// Options that fill a VerifierConfig. The same names are used on the
   /// command line and as keys in the config file.
   boost::program_options::options_description verifierOptions();

   /// Reads the options added by verifierOptions. Throws std::runtime_error
   /// if a code hash is not 32 bytes of hex.
   VerifierConfig loadVerifierConfig(const boost::program_options::variables_map& vm);

   std::ostream& operator<<(std::ostream& os, HashType t);

   void validate(boost::any& v, const std::vector<std::string>& values, HashType*, int);
}  // namespace cellmarket
