#pragma once

#include <cellmarket/Cell.hpp>
#include <cellmarket/TransactionVerifier.hpp>
#include <cellmarket/VerifierConfig.hpp>
#include <cellmarket/identity.hpp>
#include <cellmarket/uint128.hpp>
#include <services/script/marketTypes.hpp>

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace cellmarket
{
   /// Base units per currency unit
   constexpr std::uint64_t shannons = 100'000'000;

   class TraceResult
   {
     public:
      TraceResult(VerifyResult&& r);
      bool succeeded();
      bool failed(std::int8_t expected);

      template <typename E>
         requires std::is_enum_v<E>
      bool failed(E expected)
      {
         return failed(static_cast<std::int8_t>(expected));
      }

      const VerifyResult& result() { return _r; }

     protected:
      VerifyResult _r;
   };

   /// The scripts and cells of one market
   struct TestMarket
   {
      Script      type;
      Checksum256 typeHash = {};
      Script      lock;
      Checksum256 tokenCodeHash = {};
      HashType    tokenHashType = HashType::data2;

      Script      token(TokenSide side) const;
      Checksum256 tokenHash(TokenSide side) const;

      ScriptService::MarketData data(bool resolved = false, bool outcome = false) const;

      ResolvedCell cell(std::uint64_t capacity, const ScriptService::MarketData& data) const;
      ResolvedCell cell(std::uint64_t capacity, bool resolved = false, bool outcome = false) const
      {
         return cell(capacity, data(resolved, outcome));
      }

      /// A plain holding of `amount` tokens
      ResolvedCell tokens(TokenSide side, uint128 amount, const Script& owner) const;

      /// A limit order that anyone may fill by paying the seller, whose
      /// payment lock hash is stored in the order's lock args
      ResolvedCell order(TokenSide          side,
                         uint128            amount,
                         uint128            limitPrice,
                         const Checksum256& sellerLockHash) const;
   };

   /**
    * Manages cells and runs the market and token programs over transactions.
    *
    * Out points are unique for the lifetime of the ledger, so markets
    * created from different funding cells have different identifiers.
    */
   class TestLedger
   {
     public:
      static constexpr std::uint64_t cellCapacity = 142 * shannons;

      explicit TestLedger(bool strictTypes = true);

      const VerifierConfig& config() const { return _config; }
      TransactionVerifier&  verifier() { return _verifier; }

      OutPoint nextOutPoint();

      /// A lock unique to `name`, standing in for a signature lock
      Script userLock(std::string_view name) const;

      /// A lock that anyone may spend
      Script alwaysSuccess(Bytes args = {}) const;

      ResolvedCell plain(std::uint64_t capacity, const Script& lock) const;

      /// A market whose creating transaction consumes `firstInput` first and
      /// places the market cell at `outputIndex`
      TestMarket market(const OutPoint& firstInput, std::uint64_t outputIndex = 0) const;

      TraceResult verify(const Transaction& tx) const;

     private:
      VerifierConfig      _config;
      TransactionVerifier _verifier;
      std::uint32_t       _nextTx = 0;
   };

   /// Assembles a transaction out of resolved cells
   class TxBuilder
   {
     public:
      explicit TxBuilder(TestLedger& ledger) : ledger{ledger} {}

      /// Consumes `cell` at a fresh out point
      TxBuilder& input(const ResolvedCell& cell);
      TxBuilder& input(const ResolvedCell& cell, const OutPoint& at);
      TxBuilder& output(const ResolvedCell& cell);

      const Transaction& tx() const { return _tx; }
      Transaction&       tx() { return _tx; }

      TraceResult verify() const { return ledger.verify(_tx); }

     private:
      TestLedger& ledger;
      Transaction _tx;
   };
}  // namespace cellmarket
