#include <cellmarket/ConfigFile.hpp>
#include <cellmarket/TransactionVerifier.hpp>
#include <cellmarket/VerifierConfig.hpp>
#include <cellmarket/check.hpp>
#include <cellmarket/identity.hpp>
#include <cellmarket/log.hpp>
#include <cellmarket/molecule.hpp>
#include <services/script/Market.hpp>
#include <services/script/MarketToken.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>

using namespace cellmarket;
using namespace ScriptService;

namespace po = boost::program_options;

namespace
{
   const char usage[] = "USAGE: cmverify [options] transaction-file";

   constexpr int exitAccepted = 0;
   constexpr int exitRejected = 1;
   constexpr int exitUsage    = 2;

   Transaction readTransaction(const std::string& path)
   {
      std::ifstream in(path);
      check(in.is_open(), "Cannot open " + path);
      std::string text;
      for (auto iter = std::istreambuf_iterator<char>(in); iter != std::istreambuf_iterator<char>();
           ++iter)
      {
         if (!std::isspace(static_cast<unsigned char>(*iter)))
            text.push_back(*iter);
      }
      std::vector<char> bytes;
      check(from_hex(text, bytes), path + ": expected hex");
      return molecule::unpackTransaction(bytes);
   }

   TransactionVerifier makeVerifier(const VerifierConfig& config)
   {
      TransactionVerifier result{config.strictTypes};
      if (!isZero(config.marketCodeHash))
         result.add(config.marketCodeHash, config.marketHashType, std::string(Market::name),
                    &Market::verify);
      else
         CELLMARKET_LOG(loggers::generic::get(), warning) << "market-code-hash is not set";
      if (!isZero(config.tokenCodeHash))
         result.add(config.tokenCodeHash, config.tokenHashType, std::string(MarketToken::name),
                    &MarketToken::verify);
      else
         CELLMARKET_LOG(loggers::generic::get(), warning) << "token-code-hash is not set";
      return result;
   }

   std::uint64_t parseIndex(const std::string& s)
   {
      std::uint64_t result = 0;
      auto          err    = std::from_chars(s.data(), s.data() + s.size(), result);
      check(err.ec == std::errc() && err.ptr == s.data() + s.size(), "Invalid index: " + s);
      return result;
   }

   // --type-id <outpoint-hex> <index>
   void printTypeId(const std::vector<std::string>& args)
   {
      check(args.size() == 2, "--type-id expects an out point and an output index");
      std::vector<char> outPoint;
      check(from_hex(args[0], outPoint) && outPoint.size() == molecule::outPointSize,
            "The out point must be 36 bytes of hex: tx hash followed by the LE u32 index");
      std::cout << to_hex(deriveMarketIdentifier(molecule::unpackOutPoint(outPoint),
                                                 parseIndex(args[1])))
                << "\n";
   }

   // --token-hash <market-type-hash> <side>
   void printTokenHash(const VerifierConfig& config, const std::vector<std::string>& args)
   {
      check(args.size() == 2, "--token-hash expects a market type hash and a side");
      Checksum256 marketTypeHash;
      check(from_hex(args[0], marketTypeHash), "The market type hash must be 32 bytes of hex");
      std::optional<TokenSide> side;
      if (args[1] == "yes" || args[1] == "1")
         side = TokenSide::yes;
      else if (args[1] == "no" || args[1] == "2")
         side = TokenSide::no;
      check(side.has_value(), "The side must be yes or no");
      check(!isZero(config.tokenCodeHash), "token-code-hash is not set");
      std::cout << to_hex(deriveTokenIdentity(config.tokenCodeHash, config.tokenHashType,
                                              marketTypeHash, *side))
                << "\n";
   }

   void printResult(const VerifyResult& result)
   {
      for (const auto& group : result.groups)
      {
         std::cout << to_hex(group.scriptHash) << " ";
         if (group.skipped)
            std::cout << "skipped";
         else
            std::cout << (group.program.empty() ? "unregistered" : group.program) << " "
                      << static_cast<int>(group.code);
         std::cout << " (" << group.inputs << " in, " << group.outputs << " out)\n";
      }
      if (result.accepted())
         std::cout << "accepted\n";
      else
         std::cout << "rejected " << static_cast<int>(result.code) << "\n";
   }
}  // namespace

int main(int argc, char* argv[])
{
   std::string              configPath;
   std::string              transactionPath;
   std::string              logLevel;
   std::vector<std::string> typeIdArgs;
   std::vector<std::string> tokenHashArgs;

   po::options_description common_opts = verifierOptions();

   po::options_description desc("cmverify");
   auto                    opt = desc.add_options();
   opt("config,c", po::value(&configPath)->value_name("path"), "Read options from a config file");
   opt("log-level", po::value(&logLevel)->value_name("level"),
       "Minimum log severity: debug, info, notice, warning, error or critical");
   opt("type-id", po::value(&typeIdArgs)->multitoken()->value_name("outpoint index"),
       "Print the market identifier for a creation consuming this out point first");
   opt("token-hash", po::value(&tokenHashArgs)->multitoken()->value_name("market side"),
       "Print the type hash of a market's YES or NO tokens");
   opt("transaction", po::value(&transactionPath)->value_name("path"),
       "File holding a hex-encoded transaction");
   desc.add(common_opts);
   // These should be usable on the command line and shown in help
   auto add_cmdonly = [](auto& opts)
   { opts.add_options()("help,h", "Show this message")("version,V", "Print version information"); };
   add_cmdonly(desc);

   po::positional_options_description positional;
   positional.add("transaction", 1);

   // Options that are only allowed in the config file
   po::options_description cfg_opts("cmverify");
   cfg_opts.add(common_opts);
   cfg_opts.add_options()("logger.*", po::value<std::string>(), "Log configuration");

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                vm);
      if (vm.count("config"))
      {
         auto          path = vm["config"].as<std::string>();
         std::ifstream in(path);
         if (!in)
            throw std::runtime_error("Cannot open " + path);
         po::store(cellmarket::parse_config_file(in, cfg_opts, path), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help") && !vm.count("version"))
      {
         std::cerr << e.what() << "\n";
         return exitUsage;
      }
   }

   if (vm.count("help"))
   {
      std::cerr << usage << "\n\n";
      std::cerr << desc << "\n";
      return exitUsage;
   }

   if (vm.count("version"))
   {
      std::cerr << "cmverify " << CELLMARKET_VERSION << "\n";
      return exitAccepted;
   }

   try
   {
      if (!logLevel.empty())
         loggers::configure(boost::lexical_cast<loggers::level>(logLevel));
      else if (vm.count("logger.level") || vm.count("logger.format"))
         loggers::configure(vm);
      else
         loggers::configure_default();
   }
   catch (std::exception& e)
   {
      std::cerr << "Invalid log configuration: " << e.what() << "\n";
      return exitUsage;
   }

   VerifierConfig config;
   try
   {
      config = loadVerifierConfig(vm);
      if (!typeIdArgs.empty())
      {
         printTypeId(typeIdArgs);
         return exitAccepted;
      }
      if (!tokenHashArgs.empty())
      {
         printTokenHash(config, tokenHashArgs);
         return exitAccepted;
      }
      check(!transactionPath.empty(), usage);
   }
   catch (std::exception& e)
   {
      std::cerr << e.what() << "\n";
      return exitUsage;
   }

   Transaction tx;
   try
   {
      tx = readTransaction(transactionPath);
   }
   catch (std::exception& e)
   {
      CELLMARKET_LOG(loggers::generic::get(), error) << e.what();
      return exitUsage;
   }

   auto result = makeVerifier(config).verify(tx);
   printResult(result);
   return result.accepted() ? exitAccepted : exitRejected;
}
