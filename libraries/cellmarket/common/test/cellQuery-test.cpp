#include <cellmarket/cellQuery.hpp>
#include <cellmarket/scriptErrors.hpp>

#include <catch2/catch.hpp>

#include <limits>

using namespace cellmarket;

namespace
{
   Checksum256 filled(std::uint8_t b)
   {
      Checksum256 result;
      result.fill(b);
      return result;
   }

   Bytes amount(uint128 value, std::size_t size = 16)
   {
      Bytes result;
      writeLE(value, result);
      result.resize(size);
      return result;
   }

   int errorOf(auto&& f)
   {
      try
      {
         f();
      }
      catch (std::system_error& e)
      {
         return e.code().value();
      }
      return 0;
   }
}  // namespace

SCENARIO("Aggregating cells")
{
   GIVEN("A transaction with token cells of two types and plain cells")
   {
      Script alice{filled(0x0a), HashType::type, {1}};
      Script bob{filled(0x0a), HashType::type, {2}};
      Script yes{filled(0x0b), HashType::data2, {1}};
      Script no{filled(0x0b), HashType::data2, {2}};

      Transaction tx;
      auto        in = [&](const Script& lock, std::optional<Script> type, Bytes data,
                    std::uint64_t capacity = 100)
      {
         tx.inputs.push_back(CellInput{});
         tx.resolvedInputs.push_back(ResolvedCell{CellOutput{capacity, lock, type}, data});
      };
      auto out = [&](const Script& lock, std::optional<Script> type, Bytes data,
                     std::uint64_t capacity = 100)
      {
         tx.outputs.push_back(CellOutput{capacity, lock, type});
         tx.outputsData.push_back(data);
      };
      in(alice, yes, amount(5));
      in(alice, no, amount(7, 32));
      in(bob, yes, amount(11));
      in(bob, std::nullopt, {}, 300);
      out(alice, yes, amount(16));
      out(bob, std::nullopt, {}, 250);
      out(bob, std::nullopt, {}, 70);

      CellQuery query{tx};
      auto      yesHash = yes.hash();
      auto      noHash  = no.hash();

      THEN("Amounts are summed per type")
      {
         CHECK(query.sumAmounts(Source::input, yesHash) == 16);
         CHECK(query.sumAmounts(Source::input, noHash) == 7);
         CHECK(query.sumAmounts(Source::output, yesHash) == 16);
         CHECK(query.sumAmounts(Source::output, noHash) == 0);
      }
      THEN("Cells are found and counted by type")
      {
         CHECK(query.count(Source::input, yesHash) == 2);
         CHECK(query.find(Source::input, yesHash) == 0);
         CHECK(query.indices(Source::input, yesHash) == std::vector<std::size_t>{0, 2});
         CHECK(!query.find(Source::output, noHash));
         CHECK(query.hasType(Source::input, 1, noHash));
         CHECK(!query.hasType(Source::input, 3, noHash));
      }
      THEN("Plain capacity is summed per lock")
      {
         CHECK(query.sumPlainCapacity(Source::input, bob.hash()) == 300);
         CHECK(query.sumPlainCapacity(Source::output, bob.hash()) == 320);
         CHECK(query.sumPlainCapacity(Source::input, alice.hash()) == 0);
         CHECK(query.countPlain(Source::input, bob.hash()) == 1);
         CHECK(query.countPlain(Source::input, alice.hash()) == 0);
         CHECK(query.lockHash(Source::input, 3) == bob.hash());
      }
      THEN("Indexes past the end are rejected")
      {
         CHECK(errorOf([&] { query.output(Source::output, 3); }) ==
               static_cast<int>(ScriptError::indexOutOfBound));
      }
   }
   GIVEN("A token cell with a short payload")
   {
      Script      lock{filled(0x0a), HashType::type, {}};
      Script      type{filled(0x0b), HashType::data2, {}};
      Transaction tx;
      tx.outputs.push_back(CellOutput{100, lock, type});
      tx.outputsData.push_back(Bytes(15, 1));
      CellQuery query{tx};

      THEN("Summing fails with lengthNotEnough")
      {
         CHECK(errorOf([&] { query.sumAmounts(Source::output, type.hash()); }) ==
               static_cast<int>(ScriptError::lengthNotEnough));
      }
   }
   GIVEN("Token cells whose amounts overflow")
   {
      Script      lock{filled(0x0a), HashType::type, {}};
      Script      type{filled(0x0b), HashType::data2, {}};
      Transaction tx;
      for (int i = 0; i < 2; ++i)
      {
         tx.outputs.push_back(CellOutput{100, lock, type});
         tx.outputsData.push_back(amount(std::numeric_limits<uint128>::max()));
      }
      CellQuery query{tx};

      THEN("Summing fails with overflow")
      {
         CHECK(errorOf([&] { query.sumAmounts(Source::output, type.hash()); }) ==
               static_cast<int>(ScriptError::overflow));
      }
   }
   GIVEN("A transaction whose inputs are not all resolved")
   {
      Transaction tx;
      tx.inputs.push_back(CellInput{});

      THEN("Constructing a query fails")
      {
         CHECK(errorOf([&] { CellQuery query{tx}; }) ==
               static_cast<int>(ScriptError::indexOutOfBound));
      }
   }
}
