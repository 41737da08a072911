#include <cellmarket/tester.hpp>

#include <cellmarket/crypto.hpp>
#include <services/script/Market.hpp>
#include <services/script/MarketToken.hpp>
#include <services/script/tokenTypes.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace ScriptService;

namespace cellmarket
{
   namespace
   {
      Checksum256 hashOf(std::string_view s)
      {
         return sha256(s.data(), s.size());
      }

      std::string describe(const VerifyResult& r)
      {
         std::string result;
         for (const auto& g : r.groups)
         {
            result += (g.program.empty() ? std::string("<unregistered>") : g.program) + " " +
                      to_hex(g.scriptHash) + ": " + std::to_string(g.code) + "\n";
         }
         return result + "verdict: " + std::to_string(r.code);
      }
   }  // namespace

   TraceResult::TraceResult(VerifyResult&& r) : _r(std::move(r)) {}

   bool TraceResult::succeeded()
   {
      if (!_r.accepted())
      {
         UNSCOPED_INFO("transaction failed:\n" << describe(_r) << "\n");
      }
      return _r.accepted();
   }

   bool TraceResult::failed(std::int8_t expected)
   {
      if (_r.accepted())
      {
         UNSCOPED_INFO("transaction succeeded, but was expected to fail");
         return false;
      }
      if (_r.code == expected)
      {
         return true;
      }
      UNSCOPED_INFO("transaction was expected to fail with " << static_cast<int>(expected)
                                                             << ", but it failed with:\n"
                                                             << describe(_r) << "\n");
      return false;
   }

   Script TestMarket::token(TokenSide side) const
   {
      return tokenScript(tokenCodeHash, tokenHashType, typeHash, side);
   }

   Checksum256 TestMarket::tokenHash(TokenSide side) const
   {
      return token(side).hash();
   }

   MarketData TestMarket::data(bool resolved, bool outcome) const
   {
      return MarketData{tokenCodeHash, tokenHashType, resolved, outcome};
   }

   ResolvedCell TestMarket::cell(std::uint64_t capacity, const MarketData& data) const
   {
      return ResolvedCell{CellOutput{capacity, lock, type}, data.pack()};
   }

   ResolvedCell TestMarket::tokens(TokenSide side, uint128 amount, const Script& owner) const
   {
      Bytes data;
      writeLE(amount, data);
      return ResolvedCell{CellOutput{TestLedger::cellCapacity, owner, token(side)},
                          std::move(data)};
   }

   ResolvedCell TestMarket::order(TokenSide          side,
                                  uint128            amount,
                                  uint128            limitPrice,
                                  const Checksum256& sellerLockHash) const
   {
      Bytes sellerKey(sellerLockHash.begin(), sellerLockHash.end());
      Script orderLock{lock.codeHash, lock.hashType, std::move(sellerKey)};
      return ResolvedCell{CellOutput{TestLedger::cellCapacity, orderLock, token(side)},
                          TokenData{amount, limitPrice}.pack()};
   }

   TestLedger::TestLedger(bool strictTypes) : _verifier{strictTypes}
   {
      _config.marketCodeHash = hashOf("market");
      _config.tokenCodeHash  = hashOf("market-token");
      _config.strictTypes    = strictTypes;
      _verifier.add(_config.marketCodeHash, _config.marketHashType, std::string(Market::name),
                    &Market::verify);
      _verifier.add(_config.tokenCodeHash, _config.tokenHashType,
                    std::string(MarketToken::name), &MarketToken::verify);
   }

   OutPoint TestLedger::nextOutPoint()
   {
      return OutPoint{hashOf("funding-" + std::to_string(_nextTx++)), 0};
   }

   Script TestLedger::userLock(std::string_view name) const
   {
      auto  key = hashOf(name);
      Bytes args(key.begin(), key.begin() + 20);
      return Script{hashOf("secp256k1-blake160"), HashType::type, std::move(args)};
   }

   Script TestLedger::alwaysSuccess(Bytes args) const
   {
      return Script{hashOf("always-success"), HashType::data2, std::move(args)};
   }

   ResolvedCell TestLedger::plain(std::uint64_t capacity, const Script& lock) const
   {
      return ResolvedCell{CellOutput{capacity, lock, std::nullopt}, {}};
   }

   TestMarket TestLedger::market(const OutPoint& firstInput, std::uint64_t outputIndex) const
   {
      auto       id = deriveMarketIdentifier(firstInput, outputIndex);
      TestMarket result;
      result.type          = Script{_config.marketCodeHash, _config.marketHashType,
                           Bytes(id.begin(), id.end())};
      result.typeHash      = result.type.hash();
      result.lock          = alwaysSuccess();
      result.tokenCodeHash = _config.tokenCodeHash;
      result.tokenHashType = _config.tokenHashType;
      return result;
   }

   TraceResult TestLedger::verify(const Transaction& tx) const
   {
      return TraceResult{_verifier.verify(tx)};
   }

   TxBuilder& TxBuilder::input(const ResolvedCell& cell)
   {
      return input(cell, ledger.nextOutPoint());
   }

   TxBuilder& TxBuilder::input(const ResolvedCell& cell, const OutPoint& at)
   {
      _tx.inputs.push_back(CellInput{0, at});
      _tx.resolvedInputs.push_back(cell);
      return *this;
   }

   TxBuilder& TxBuilder::output(const ResolvedCell& cell)
   {
      _tx.outputs.push_back(cell.output);
      _tx.outputsData.push_back(cell.data);
      return *this;
   }
}  // namespace cellmarket
