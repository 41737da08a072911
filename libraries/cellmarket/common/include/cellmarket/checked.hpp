#pragma once

#include <optional>
#include <type_traits>

namespace cellmarket
{
   // Overflow is reported, never wrapped and never clamped.
   template <typename T>
   constexpr std::optional<T> checkedAdd(T lhs, T rhs)
   {
      T result;
      if (__builtin_add_overflow(lhs, rhs, &result))
         return std::nullopt;
      return result;
   }

   template <typename T>
   constexpr std::optional<T> checkedSub(T lhs, T rhs)
   {
      T result;
      if (__builtin_sub_overflow(lhs, rhs, &result))
         return std::nullopt;
      return result;
   }

   template <typename T>
   constexpr std::optional<T> checkedMultiply(T lhs, T rhs)
   {
      T result;
      if (__builtin_mul_overflow(lhs, rhs, &result))
         return std::nullopt;
      return result;
   }

   template <typename T>
   constexpr T saturatingSub(T lhs, T rhs)
   {
      return checkedSub(lhs, rhs).value_or(T{0});
   }
}  // namespace cellmarket
