//
// Repdigits.h
//
// Sums of numbers whose digits are all identical. These divide their own
// right-rotation with multiplier 1 and are counted separately from the
// patterns generated for multipliers 2-9.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_REPDIGITS_H_
#define ROTDIV_REPDIGITS_H_

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <format>


class Repdigits {
 public:
  static constexpr std::uint64_t MODULUS = 100000;

  constexpr static std::uint64_t repunit_residue(unsigned n);
  constexpr static std::uint64_t repdigit_sum(unsigned max_digits);
  constexpr static std::uint64_t closed_form_sum();
};

//------------------------------------------------------------------------------
// Static methods
//------------------------------------------------------------------------------

// Compute R(n) mod MODULUS, where R(n) is the repunit with `n` ones.
//
// Once n reaches the number of digits in MODULUS the residue stays at 11111.

constexpr std::uint64_t Repdigits::repunit_residue(unsigned n)
{
  std::uint64_t result = 0;
  for (unsigned i = 0; i < n; ++i) {
    result = (result * 10 + 1) % MODULUS;
    if (result == (MODULUS - 1) / 9) {
      break;
    }
  }
  return result;
}

// Compute the sum modulo MODULUS of all repdigits d * R(n) with d in 1-9 and n
// in [2, max_digits]. Single digits are outside the range (10, 10^max_digits).
//
// In the event of a math overflow error, throw a `std::overflow_error`
// exception with a relevant error message.

constexpr std::uint64_t Repdigits::repdigit_sum(unsigned max_digits)
{
  constexpr auto MAX_UINT64 = std::numeric_limits<std::uint64_t>::max();
  constexpr std::uint64_t DIGIT_SUM = 45;  // 1 + 2 + ... + 9

  std::uint64_t total = 0;

  for (unsigned n = 2; n <= max_digits; ++n) {
    const std::uint64_t term = DIGIT_SUM * repunit_residue(n);
    if (term > MAX_UINT64 - total) {
      throw std::overflow_error(
          std::format("Overflow in repdigit_sum({})", max_digits));
    }
    total = (total + term) % MODULUS;
  }
  return total;
}

// Sum of repdigits below 10^100 in closed form: lengths 2, 3, 4 contribute
// 11 + 111 + 1111 = 1233 per unit digit, and each of the 96 lengths 5-100
// contributes 11111.

constexpr std::uint64_t Repdigits::closed_form_sum()
{
  std::uint64_t total = 0;
  for (std::uint64_t i = 1; i < 10; ++i) {
    total += i * (1233 + 96 * 11111);
  }
  return total % MODULUS;
}

#endif
