#include <cellmarket/ConfigFile.hpp>
#include <cellmarket/VerifierConfig.hpp>
#include <cellmarket/log.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>
#include <sstream>

using namespace cellmarket;
namespace po = boost::program_options;

namespace
{
   po::variables_map parse(const std::string& text)
   {
      auto opts = verifierOptions();
      opts.add_options()("logger.*", po::value<std::string>(), "Log configuration");
      std::istringstream in(text);
      po::variables_map  vm;
      po::store(cellmarket::parse_config_file(in, opts, "test.ini"), vm);
      po::notify(vm);
      return vm;
   }

   constexpr const char* marketHash =
       "1111111111111111111111111111111111111111111111111111111111111111";
}  // namespace

TEST_CASE("config file")
{
   SECTION("Defaults")
   {
      auto config = loadVerifierConfig(parse(""));
      CHECK(isZero(config.marketCodeHash));
      CHECK(isZero(config.tokenCodeHash));
      CHECK(config.marketHashType == HashType::data2);
      CHECK(config.tokenHashType == HashType::data2);
      CHECK(config.strictTypes);
   }
   SECTION("Values")
   {
      auto config = loadVerifierConfig(parse(std::string("# scripts\n") +
                                             "market-code-hash = 0x" + marketHash + "\n" +
                                             "market-hash-type = type # deployed by type id\n" +
                                             "token-hash-type = \"data1\"\n" +
                                             "strict-types = false\n"));
      Checksum256 expected;
      expected.fill(0x11);
      CHECK(config.marketCodeHash == expected);
      CHECK(config.marketHashType == HashType::type);
      CHECK(config.tokenHashType == HashType::data1);
      CHECK(!config.strictTypes);
   }
   SECTION("Sections prefix keys")
   {
      auto vm = parse("[logger]\nlevel = debug\n");
      CHECK(vm["logger.level"].as<std::string>() == "debug");
   }
   SECTION("Quoted values keep #")
   {
      auto vm = parse("logger.format = \"a#b\" # comment\n");
      CHECK(vm["logger.format"].as<std::string>() == "a#b");
   }
   SECTION("Environment variables are expanded")
   {
      ::setenv("CELLMARKET_TEST_HASH", marketHash, 1);
      auto config = loadVerifierConfig(parse("token-code-hash = $CELLMARKET_TEST_HASH\n"));
      CHECK(to_hex(config.tokenCodeHash) == marketHash);
   }
   SECTION("Unknown keys name the file and line")
   {
      CHECK_THROWS_WITH(parse("\nstrict-types = true\nbogus = 1\n"),
                        "test.ini:3: Unknown option bogus");
   }
   SECTION("Lines need a value")
   {
      CHECK_THROWS_WITH(parse("strict-types\n"), "test.ini:1: expected key = value");
   }
   SECTION("Invalid hash types are rejected")
   {
      CHECK_THROWS_AS(parse("market-hash-type = data3\n"), po::invalid_option_value);
   }
   SECTION("Code hashes must be 32 bytes")
   {
      CHECK_THROWS_AS(loadVerifierConfig(parse("market-code-hash = 1234\n")),
                      std::runtime_error);
   }
}

TEST_CASE("log levels")
{
   CHECK(boost::lexical_cast<loggers::level>("notice") == loggers::level::notice);
   CHECK(boost::lexical_cast<std::string>(loggers::level::warning) == "warning");
   CHECK(boost::lexical_cast<loggers::format>("json") == loggers::format::json);
   CHECK_THROWS_AS(boost::lexical_cast<loggers::level>("loud"), boost::bad_lexical_cast);
}
