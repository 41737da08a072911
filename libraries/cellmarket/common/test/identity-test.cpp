#include <cellmarket/crypto.hpp>
#include <cellmarket/identity.hpp>
#include <cellmarket/molecule.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace cellmarket;

namespace
{
   Checksum256 filled(std::uint8_t b)
   {
      Checksum256 result;
      result.fill(b);
      return result;
   }

   Checksum256 hex(std::string_view s)
   {
      Checksum256 result;
      REQUIRE(from_hex(s, result));
      return result;
   }
}  // namespace

TEST_CASE("sha256")
{
   CHECK(to_hex(sha256("abc", 3)) ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

   Sha256 h;
   h.update("a", 1).update("bc", 2);
   CHECK(h.final() == sha256("abc", 3));
}

TEST_CASE("hex")
{
   std::vector<char> bytes;
   CHECK(from_hex("0x00ff10", bytes));
   CHECK(bytes == std::vector<char>{0, static_cast<char>(0xff), 0x10});
   CHECK(to_hex(bytes) == "00ff10");
   CHECK(!from_hex("abc", bytes));
   CHECK(!from_hex("zz", bytes));

   Checksum256 c;
   CHECK(!from_hex("00ff", c));
}

TEST_CASE("script serialization")
{
   Script s{filled(0xaa), HashType::data2, {}};
   CHECK(to_hex(molecule::pack(s)) ==
         "35000000100000003000000031000000"
         "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
         "04"
         "00000000");
   CHECK(to_hex(s.hash()) == "aeaec7c16e9c0f422a77a61994a36e5922fb65bdd50cc7ae23cb95641b4d8f08");
}

SCENARIO("Deriving token identities")
{
   GIVEN("A token code hash and a market type hash")
   {
      auto code   = filled(0xaa);
      auto market = filled(0x11);

      THEN("Each side has a fixed type hash")
      {
         CHECK(deriveTokenIdentity(code, HashType::data2, market, TokenSide::yes) ==
               hex("9bc906424b2e47a4411d89396bf5553af10a5b0ed464892a4f9d13c61233c4ef"));
         CHECK(deriveTokenIdentity(code, HashType::data2, market, TokenSide::no) ==
               hex("ba34d6437d6acdf7bfbc20789b459acdee08f5278d281aef833d00d4f6614d6a"));
      }
      THEN("Derivation is deterministic")
      {
         CHECK(deriveTokenIdentity(code, HashType::data2, market, TokenSide::yes) ==
               deriveTokenIdentity(code, HashType::data2, market, TokenSide::yes));
      }
      THEN("The token args are the market type hash followed by the side")
      {
         auto args = tokenArgs(market, TokenSide::no);
         REQUIRE(args.size() == tokenArgsSize);
         auto same = [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); };
         CHECK(std::equal(market.begin(), market.end(), args.begin(), same));
         CHECK(args.back() == 0x02);
      }
      THEN("The derived hash is the hash of the token script")
      {
         CHECK(deriveTokenIdentity(code, HashType::data2, market, TokenSide::yes) ==
               tokenScript(code, HashType::data2, market, TokenSide::yes).hash());
      }
      THEN("Changing any input changes the hash")
      {
         auto base        = deriveTokenIdentity(code, HashType::data2, market, TokenSide::yes);
         auto otherCode   = code;
         otherCode[31]    = 0xab;
         auto otherMarket = market;
         otherMarket[0]   = 0x10;
         CHECK(deriveTokenIdentity(otherCode, HashType::data2, market, TokenSide::yes) != base);
         CHECK(deriveTokenIdentity(code, HashType::data1, market, TokenSide::yes) != base);
         CHECK(deriveTokenIdentity(code, HashType::type, market, TokenSide::yes) != base);
         CHECK(deriveTokenIdentity(code, HashType::data2, otherMarket, TokenSide::yes) != base);
         CHECK(deriveTokenIdentity(code, HashType::data2, market, TokenSide::no) != base);
      }
   }
}

SCENARIO("Deriving market identifiers")
{
   GIVEN("The first input of a transaction")
   {
      OutPoint first{filled(0x22), 1};

      THEN("The identifier is the hash of the out point and output index")
      {
         CHECK(deriveMarketIdentifier(first, 0) ==
               hex("985101440a94b8b9627df1ea7f19884b153fd25ae54af8bd5726c6b8b3e97ee4"));
         CHECK(deriveMarketIdentifier(first, 1) ==
               hex("6169e36ff54d14f22e2e5e6c2a2d27194b4fe3ab9cc2317b49a897a66bc9b306"));
      }
      THEN("A different out point gives a different identifier")
      {
         OutPoint other{filled(0x22), 2};
         CHECK(deriveMarketIdentifier(other, 0) != deriveMarketIdentifier(first, 0));
      }
   }
}

TEST_CASE("token sides")
{
   CHECK(toTokenSide(1) == TokenSide::yes);
   CHECK(toTokenSide(2) == TokenSide::no);
   CHECK(!toTokenSide(0));
   CHECK(!toTokenSide(3));
   CHECK(winningSide(true) == TokenSide::yes);
   CHECK(winningSide(false) == TokenSide::no);
   CHECK(otherSide(TokenSide::yes) == TokenSide::no);
}
