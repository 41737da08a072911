#include <services/script/tokenErrors.hpp>

#include <string>

namespace ScriptService
{
   namespace
   {
      class token_error_category : public std::error_category
      {
         virtual const char* name() const noexcept override { return "market-token"; }
         virtual std::string message(int condition) const override
         {
            switch (TokenError(condition))
            {
               case TokenError::invalidTokenArgs:
                  return "Token args must be a market type hash and a side of 1 or 2";
               case TokenError::unauthorizedMinting:
                  return "Minting without the market cell is not allowed";
               case TokenError::invalidRemainder:
                  return "Order remainder exceeds the order amount";
               case TokenError::paymentMismatch:
                  return "Seller payment does not match the filled orders";
            }
            if (condition < static_cast<int>(TokenError::invalidTokenArgs))
               return cellmarket::scriptCategory().message(condition);
            return "unknown token error " + std::to_string(condition);
         }
      };
   }  // namespace

   const std::error_category& tokenCategory()
   {
      static const token_error_category result;
      return result;
   }

   std::error_code make_error_code(TokenError e)
   {
      return std::error_code(static_cast<int>(e), tokenCategory());
   }
}  // namespace ScriptService
