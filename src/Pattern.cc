//
// Pattern.cc
//
// Represents the repeating digit block of a number that divides its own
// right-rotation, for a given multiplier and least significant digit.
//
// If a number n with last digit d satisfies rotate(n) = m * n, then the digits
// of n are fixed by multiplication with carry, working upward from d: each
// product m * digit + carry gives the next digit up. The block closes when the
// product returns to exactly d (with no carry), because at that point the
// rotated-in digit d is what the top of m * n must be. Any repetition of the
// block is again a divisor of its rotation.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "Pattern.h"

#include <sstream>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <format>


// Generate the pattern for multiplier `m` and least significant digit `d`.
//
// Only the lowest TAIL_DIGITS digits are recorded, but the recurrence is
// followed until the cycle closes so that the period and the leading digit are
// known.
//
// In the event of bad input, throw a `std::invalid_argument` exception. If the
// cycle fails to close within MAX_STEPS steps, throw a `std::runtime_error`.

Pattern::Pattern(unsigned m, unsigned d)
    : multiplier(m), lsd(d)
{
  if (m < 2 || m > 9) {
    throw std::invalid_argument(
        std::format("Multiplier must be in the range 2-9, got {}", m));
  }
  if (d < 1 || d > 9) {
    throw std::invalid_argument(
        std::format("Least significant digit must be in the range 1-9, got {}",
            d));
  }

  digit.at(0) = d;
  unsigned next = 0;
  unsigned carry = 0;
  unsigned steps = 1;
  unsigned candidate = m * d;

  while (candidate != d) {
    if (steps >= MAX_STEPS) {
      throw std::runtime_error(std::format(
          "Pattern for multiplier {}, digit {} did not close in {} steps", m, d,
          MAX_STEPS));
    }
    next = candidate % 10;
    if (steps < TAIL_DIGITS) {
      digit.at(steps) = next;
    }
    carry = candidate / 10;
    candidate = m * next + carry;
    ++steps;
  }

  per = steps;
  leading = next;
}

unsigned Pattern::get_multiplier() const
{
  return multiplier;
}

unsigned Pattern::get_digit() const
{
  return lsd;
}

// Return the number of digits in the repeating block.

unsigned Pattern::period() const
{
  return per;
}

unsigned Pattern::leading_digit() const
{
  return leading;
}

// A block with a leading zero is not a number of `period()` digits, and
// dropping the zero breaks the rotation property (e.g. 052631578947368421 for
// multiplier 2, digit 1).

bool Pattern::is_valid() const
{
  return leading != 0;
}

const std::array<unsigned, Pattern::TAIL_DIGITS>& Pattern::tail() const
{
  return digit;
}

// Return the integer value of the recorded tail digits, least significant
// first.
//
// In the event of a math overflow error, throw a `std::overflow_error`
// exception with a relevant error message.

std::uint64_t Pattern::tail_value() const
{
  constexpr auto MAX_UINT64 = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t result = 0;
  std::uint64_t pow10 = 1;

  for (size_t i = 0; i < digit.size(); ++i) {
    if (digit.at(i) > 9 || (digit.at(i) > 0 &&
          (MAX_UINT64 - result) / digit.at(i) < pow10)) {
      throw std::overflow_error(
          std::format("Overflow converting tail of pattern ({},{})",
              multiplier, lsd));
    }
    result += digit.at(i) * pow10;
    pow10 *= 10;
  }

  if (result >= MODULUS) {
    throw std::overflow_error(
        std::format("Tail value {} of pattern ({},{}) exceeds {} digits",
            result, multiplier, lsd, TAIL_DIGITS));
  }
  return result;
}

// Return the number of whole copies of the block that fit in a number of at
// most `max_digits` digits.

std::uint64_t Pattern::repetitions(unsigned max_digits) const
{
  return max_digits / per;
}

// Return the sum modulo MODULUS of every repetition of the block with at most
// `max_digits` digits. Every repetition shares the same low digits, since the
// period always exceeds TAIL_DIGITS for multipliers 2-9.
//
// Invalid patterns contribute nothing.

std::uint64_t Pattern::contribution(unsigned max_digits) const
{
  if (!is_valid()) {
    return 0;
  }
  return (tail_value() * (repetitions(max_digits) % MODULUS)) % MODULUS;
}

// Return the full digit block, most significant digit first.

std::string Pattern::to_string() const
{
  std::string s(1, static_cast<char>('0' + lsd));
  unsigned carry = 0;
  unsigned current = lsd;

  for (unsigned steps = 1; steps < per; ++steps) {
    const unsigned candidate = multiplier * current + carry;
    current = candidate % 10;
    carry = candidate / 10;
    s.push_back(static_cast<char>('0' + current));
  }

  std::ranges::reverse(s);
  return s;
}

// Return a printable report on the pattern, for numbers below 10^max_digits.

std::string Pattern::make_analysis(unsigned max_digits) const
{
  std::ostringstream buffer;
  const auto block = to_string();

  buffer << "Pattern:\n"
         << "   digits               " << block << '\n'
         << "   rotation             " << block.back()
                                       << block.substr(0, block.size() - 1)
                                       << '\n'
         << "   multiplier           " << multiplier << '\n'
         << "   least signif. digit  " << lsd << '\n'
         << "   period               " << per << "\n\n";

  if (!is_valid()) {
    buffer << "Leading digit is 0; the block does not divide its rotation "
              "once the zero is dropped\n";
    return buffer.str();
  }

  std::string tailstring;
  for (const auto d : digit) {
    tailstring.insert(tailstring.begin(), static_cast<char>('0' + d));
  }

  buffer << std::format("Sum below 10^{}:\n", max_digits)
         << "   low digits           " << tailstring << '\n'
         << "   repetitions          " << repetitions(max_digits) << '\n'
         << "   contribution         " << contribution(max_digits) << '\n';
  return buffer.str();
}
