#include <catch2/catch.hpp>
#include <cellmarket/tester.hpp>
#include <services/script/MarketToken.hpp>

#include <limits>

using namespace cellmarket;
using namespace ScriptService;

namespace
{
   constexpr auto yes = TokenSide::yes;
   constexpr auto no  = TokenSide::no;
}  // namespace

SCENARIO("Transferring tokens")
{
   GIVEN("Alice holding 10 YES tokens")
   {
      TestLedger t;
      auto       alice    = t.userLock("alice");
      auto       bob      = t.userLock("bob");
      auto       m        = t.market(t.nextOutPoint());
      auto       holdings = m.tokens(yes, 10, alice);

      THEN("Alice may send some to Bob")
      {
         TxBuilder tx{t};
         tx.input(holdings).output(m.tokens(yes, 4, bob)).output(m.tokens(yes, 6, alice));
         CHECK(tx.verify().succeeded());
      }
      THEN("Alice may burn tokens")
      {
         TxBuilder tx{t};
         tx.input(holdings).output(m.tokens(yes, 3, alice));
         CHECK(tx.verify().succeeded());
      }
      THEN("Tokens may not be created without the market")
      {
         TxBuilder tx{t};
         tx.input(holdings).output(m.tokens(yes, 4, bob)).output(m.tokens(yes, 7, alice));
         CHECK(tx.verify().failed(TokenError::unauthorizedMinting));
      }
      THEN("Each side is conserved separately")
      {
         TxBuilder tx{t};
         tx.input(holdings).output(m.tokens(yes, 10, bob)).output(m.tokens(no, 1, alice));
         CHECK(tx.verify().failed(TokenError::unauthorizedMinting));
      }
      THEN("Tokens of another market are a different asset")
      {
         auto      other = t.market(t.nextOutPoint());
         TxBuilder tx{t};
         tx.input(holdings).output(other.tokens(yes, 10, bob));
         CHECK(tx.verify().failed(TokenError::unauthorizedMinting));
      }
      THEN("Token data must hold an amount")
      {
         auto cell = m.tokens(yes, 10, bob);
         cell.data.resize(TokenData::legacySize - 1);
         TxBuilder tx{t};
         tx.input(holdings).output(cell);
         CHECK(tx.verify().failed(ScriptError::lengthNotEnough));
      }
   }
   GIVEN("Token scripts with malformed args")
   {
      TestLedger t;
      auto       alice = t.userLock("alice");
      auto       m     = t.market(t.nextOutPoint());

      THEN("Args without a side are rejected")
      {
         auto cell = m.tokens(yes, 1, alice);
         cell.output.type->args.pop_back();
         TxBuilder tx{t};
         tx.input(cell).output(cell);
         CHECK(tx.verify().failed(TokenError::invalidTokenArgs));
      }
      THEN("An unknown side is rejected")
      {
         auto cell                      = m.tokens(yes, 1, alice);
         cell.output.type->args.back() = 3;
         TxBuilder tx{t};
         tx.input(cell).output(cell);
         CHECK(tx.verify().failed(TokenError::invalidTokenArgs));
      }
   }
}

SCENARIO("Filling limit orders")
{
   GIVEN("Alice selling 10 YES at 7 and Bob with funds")
   {
      TestLedger t;
      auto       alice     = t.userLock("alice");
      auto       bob       = t.userLock("bob");
      auto       aliceHash = alice.hash();
      auto       m         = t.market(t.nextOutPoint());
      auto       order     = m.order(yes, 10, 7, aliceHash);
      auto       funds     = t.plain(1000 * shannons, bob);

      auto buy = [&](uint128 bought, std::uint64_t paid)
      {
         TxBuilder tx{t};
         tx.input(order).input(funds).output(m.tokens(yes, bought, bob));
         if (bought < 10)
            tx.output(m.order(yes, 10 - bought, 7, aliceHash));
         tx.output(t.plain(paid, alice)).output(t.plain(1000 * shannons - paid, bob));
         return tx;
      };

      THEN("Bob may buy part of the order at the limit price")
      {
         CHECK(buy(4, 28).verify().succeeded());
      }
      THEN("Bob may buy the whole order")
      {
         CHECK(buy(10, 70).verify().succeeded());
      }
      THEN("Underpaying is rejected")
      {
         CHECK(buy(4, 27).verify().failed(TokenError::paymentMismatch));
      }
      THEN("Overpaying is rejected")
      {
         CHECK(buy(4, 29).verify().failed(TokenError::paymentMismatch));
      }
      THEN("Changing the price of the remainder makes it a full fill")
      {
         for (uint128 price : {0, 8})
         {
            TxBuilder tx{t};
            tx.input(order)
                .input(funds)
                .output(m.tokens(yes, 4, bob))
                .output(m.order(yes, 6, price, aliceHash))
                .output(t.plain(28, alice))
                .output(t.plain(1000 * shannons - 28, bob));
            CHECK(tx.verify().failed(TokenError::paymentMismatch));
         }
      }
      THEN("A repriced remainder is paid for as a full fill")
      {
         TxBuilder tx{t};
         tx.input(order)
             .input(funds)
             .output(m.order(yes, 10, 0, aliceHash))
             .output(t.plain(70, alice))
             .output(t.plain(1000 * shannons - 70, bob));
         CHECK(tx.verify().succeeded());
      }
      THEN("Taking an order without paying is rejected")
      {
         TxBuilder tx{t};
         tx.input(order).output(m.tokens(yes, 10, bob));
         CHECK(tx.verify().failed(TokenError::paymentMismatch));
      }
      THEN("A remainder larger than the order is rejected")
      {
         TxBuilder tx{t};
         tx.input(order)
             .input(m.tokens(yes, 5, bob))
             .output(m.order(yes, 12, 7, aliceHash))
             .output(m.tokens(yes, 3, bob));
         CHECK(tx.verify().failed(TokenError::invalidRemainder));
      }
      THEN("An untouched order needs no payment")
      {
         TxBuilder tx{t};
         tx.input(order).output(m.order(yes, 10, 7, aliceHash));
         CHECK(tx.verify().succeeded());
      }
      THEN("Paying for an untouched order is rejected")
      {
         TxBuilder tx{t};
         tx.input(order)
             .input(funds)
             .output(m.order(yes, 10, 7, aliceHash))
             .output(t.plain(5, alice))
             .output(t.plain(1000 * shannons - 5, bob));
         CHECK(tx.verify().failed(TokenError::paymentMismatch));
      }
      THEN("Alice may cancel her order by spending one of her own cells")
      {
         TxBuilder tx{t};
         tx.input(order)
             .input(t.plain(100 * shannons, alice))
             .output(m.tokens(yes, 10, alice))
             .output(t.plain(100 * shannons, alice));
         CHECK(tx.verify().succeeded());
      }
      THEN("Each side checks the seller's whole payment against its own orders")
      {
         TxBuilder tx{t};
         tx.input(order)
             .input(m.order(no, 5, 3, aliceHash))
             .input(funds)
             .output(m.tokens(yes, 10, bob))
             .output(m.tokens(no, 5, bob))
             .output(t.plain(70, alice))
             .output(t.plain(1000 * shannons - 70, bob));
         CHECK(tx.verify().failed(TokenError::paymentMismatch));
      }
   }
}

SCENARIO("Settling several orders of one seller")
{
   GIVEN("Alice selling YES at 7 and at 11")
   {
      TestLedger t;
      auto       alice     = t.userLock("alice");
      auto       bob       = t.userLock("bob");
      auto       aliceHash = alice.hash();
      auto       m         = t.market(t.nextOutPoint());
      auto       funds     = t.plain(1000 * shannons, bob);

      auto fill = [&](std::vector<std::uint64_t> payments)
      {
         TxBuilder tx{t};
         tx.input(m.order(yes, 10, 7, aliceHash))
             .input(m.order(yes, 10, 11, aliceHash))
             .input(funds)
             .output(m.order(yes, 7, 7, aliceHash))
             .output(m.order(yes, 5, 11, aliceHash))
             .output(m.tokens(yes, 8, bob));
         std::uint64_t total = 0;
         for (auto p : payments)
         {
            tx.output(t.plain(p, alice));
            total += p;
         }
         tx.output(t.plain(1000 * shannons - total, bob));
         return tx;
      };

      THEN("Buying 3 at 7 and 5 at 11 requires exactly 3*7 + 5*11")
      {
         CHECK(fill({76}).verify().succeeded());
         CHECK(fill({75}).verify().failed(TokenError::paymentMismatch));
         CHECK(fill({77}).verify().failed(TokenError::paymentMismatch));
      }
      THEN("The payment may be split across cells")
      {
         CHECK(fill({21, 55}).verify().succeeded());
      }
      THEN("Orders at the same price may share one remainder")
      {
         TxBuilder tx{t};
         tx.input(m.order(yes, 10, 7, aliceHash))
             .input(m.order(yes, 10, 7, aliceHash))
             .output(m.order(yes, 10, 7, aliceHash))
             .output(m.tokens(yes, 10, bob));
         CHECK(tx.verify().succeeded());
      }
      THEN("An order of another seller between Alice's orders does not split her group")
      {
         auto      carol = t.userLock("carol");
         TxBuilder tx{t};
         tx.input(m.order(yes, 10, 7, aliceHash))
             .input(m.order(yes, 2, 5, carol.hash()))
             .input(m.order(yes, 10, 11, aliceHash))
             .input(funds)
             .output(m.order(yes, 7, 7, aliceHash))
             .output(m.order(yes, 5, 11, aliceHash))
             .output(m.tokens(yes, 10, bob))
             .output(t.plain(76, alice))
             .output(t.plain(10, carol))
             .output(t.plain(1000 * shannons - 86, bob));
         CHECK(tx.verify().succeeded());
      }
   }
}

SCENARIO("Settling orders of several sellers")
{
   GIVEN("Alice and Carol each selling YES")
   {
      TestLedger t;
      auto       alice = t.userLock("alice");
      auto       bob   = t.userLock("bob");
      auto       carol = t.userLock("carol");
      auto       m     = t.market(t.nextOutPoint());
      auto       funds = t.plain(1000 * shannons, bob);

      auto fill = [&](std::uint64_t toAlice, std::uint64_t toCarol)
      {
         TxBuilder tx{t};
         tx.input(m.order(yes, 4, 5, alice.hash()))
             .input(m.order(yes, 3, 9, carol.hash()))
             .input(funds)
             .output(m.tokens(yes, 7, bob))
             .output(t.plain(toAlice, alice))
             .output(t.plain(toCarol, carol))
             .output(t.plain(1000 * shannons - toAlice - toCarol, bob));
         return tx;
      };

      THEN("Each seller must be paid exactly")
      {
         CHECK(fill(20, 27).verify().succeeded());
         CHECK(fill(47, 0).verify().failed(TokenError::paymentMismatch));
         CHECK(fill(20, 26).verify().failed(TokenError::paymentMismatch));
      }
   }
}

SCENARIO("Settlement arithmetic")
{
   GIVEN("An order whose value does not fit in 128 bits")
   {
      TestLedger t;
      auto       alice = t.userLock("alice");
      auto       bob   = t.userLock("bob");
      auto       m     = t.market(t.nextOutPoint());
      auto       max   = std::numeric_limits<uint128>::max();

      THEN("Filling it is rejected")
      {
         TxBuilder tx{t};
         tx.input(m.order(yes, max, 2, alice.hash())).output(m.tokens(yes, max, bob));
         CHECK(tx.verify().failed(ScriptError::overflow));
      }
   }
}

SCENARIO("Token transactions that spend the market")
{
   GIVEN("An open market")
   {
      TestLedger t;
      auto       alice = t.userLock("alice");
      auto       m     = t.market(t.nextOutPoint());

      THEN("The market script alone decides on minting")
      {
         auto      set = collateralPerCompleteSet;
         TxBuilder tx{t};
         tx.input(m.cell(0))
             .input(m.order(yes, 10, 7, alice.hash()))
             .output(m.cell(2 * set))
             .output(m.tokens(yes, 12, alice))
             .output(m.tokens(no, 2, alice));
         auto result = tx.verify();
         CHECK(result.succeeded());
         CHECK(result.result().groups.size() == 3);
      }
   }
}
