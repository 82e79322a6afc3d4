//
// Pattern.h
//
// Represents the repeating digit block of a number that divides its own
// right-rotation, for a given multiplier and least significant digit.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_PATTERN_H_
#define ROTDIV_PATTERN_H_

#include <array>
#include <string>
#include <cstdint>


class Pattern {
 public:
  Pattern(unsigned m, unsigned d);
  Pattern() = delete;

  // number of low-order digits kept; the result is reported modulo 10^5
  static constexpr unsigned TAIL_DIGITS = 5;
  static constexpr std::uint64_t MODULUS = 100000;

  // cap on multiply-with-carry steps before giving up on cycle closure
  static constexpr unsigned MAX_STEPS = 200;

 private:
  unsigned multiplier = 0;
  unsigned lsd = 0;  // least significant digit (seed)
  unsigned per = 0;
  unsigned leading = 0;  // most significant digit of the block
  std::array<unsigned, TAIL_DIGITS> digit{};  // digit[0] is the ones place

 public:
  unsigned get_multiplier() const;
  unsigned get_digit() const;
  unsigned period() const;
  unsigned leading_digit() const;
  bool is_valid() const;
  const std::array<unsigned, TAIL_DIGITS>& tail() const;

  // contribution to the modular sum
  std::uint64_t tail_value() const;
  std::uint64_t repetitions(unsigned max_digits) const;
  std::uint64_t contribution(unsigned max_digits) const;

  // string output
  std::string to_string() const;
  std::string make_analysis(unsigned max_digits = 100) const;
};

#endif
