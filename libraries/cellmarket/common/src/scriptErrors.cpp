#include <cellmarket/scriptErrors.hpp>

#include <string>

namespace cellmarket
{
   namespace
   {
      class script_error_category : public std::error_category
      {
         virtual const char* name() const noexcept override { return "script"; }
         virtual std::string message(int condition) const override
         {
            switch (ScriptError(condition))
            {
               case ScriptError::indexOutOfBound:
                  return "Index out of bound";
               case ScriptError::itemMissing:
                  return "Item missing";
               case ScriptError::lengthNotEnough:
                  return "Cell data too short";
               case ScriptError::encoding:
                  return "Invalid encoding";
               case ScriptError::overflow:
                  return "Arithmetic overflow";
            }
            return "unknown script error " + std::to_string(condition);
         }
      };
   }  // namespace

   const std::error_category& scriptCategory()
   {
      static const script_error_category result;
      return result;
   }

   std::error_code make_error_code(ScriptError e)
   {
      return std::error_code(static_cast<int>(e), scriptCategory());
   }
}  // namespace cellmarket
