#include <cellmarket/VerifierConfig.hpp>

#include <cellmarket/check.hpp>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <ostream>

namespace po = boost::program_options;

namespace cellmarket
{
   namespace
   {
      Checksum256 codeHashOption(const po::variables_map& vm, const std::string& name)
      {
         Checksum256 result = {};
         auto        iter   = vm.find(name);
         if (iter == vm.end())
            return result;
         const auto& text = iter->second.as<std::string>();
         if (!text.empty())
            check(from_hex(text, result), name + " must be 32 bytes of hex");
         return result;
      }
   }  // namespace

   po::options_description verifierOptions()
   {
      po::options_description desc("Scripts");
      auto                    opt = desc.add_options();
      opt("market-code-hash", po::value<std::string>()->default_value("", "")->value_name("hex"),
          "Code hash of the market type script");
      opt("market-hash-type",
          po::value<HashType>()->default_value(HashType::data2)->value_name("type"),
          "Hash type of the market type script: data, type, data1 or data2");
      opt("token-code-hash", po::value<std::string>()->default_value("", "")->value_name("hex"),
          "Code hash of the YES/NO token type script");
      opt("token-hash-type",
          po::value<HashType>()->default_value(HashType::data2)->value_name("type"),
          "Hash type of the YES/NO token type script");
      opt("strict-types", po::value<bool>()->default_value(true)->value_name("bool"),
          "Reject transactions with type scripts that are not registered");
      return desc;
   }

   VerifierConfig loadVerifierConfig(const po::variables_map& vm)
   {
      VerifierConfig result;
      result.marketCodeHash = codeHashOption(vm, "market-code-hash");
      result.tokenCodeHash  = codeHashOption(vm, "token-code-hash");
      if (auto iter = vm.find("market-hash-type"); iter != vm.end())
         result.marketHashType = iter->second.as<HashType>();
      if (auto iter = vm.find("token-hash-type"); iter != vm.end())
         result.tokenHashType = iter->second.as<HashType>();
      if (auto iter = vm.find("strict-types"); iter != vm.end())
         result.strictTypes = iter->second.as<bool>();
      return result;
   }

   std::ostream& operator<<(std::ostream& os, HashType t)
   {
      return os << hashTypeName(t);
   }

   void validate(boost::any& v, const std::vector<std::string>& values, HashType*, int)
   {
      po::validators::check_first_occurrence(v);
      const auto& s = po::validators::get_single_string(values);
      if (auto t = hashTypeFromName(s))
         v = *t;
      else
         throw po::invalid_option_value(s);
   }
}  // namespace cellmarket
