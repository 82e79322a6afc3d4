//
// SearchContext.h
//
// This structure captures the results of the calculation.
//
// Only the coordinator has access to this data structure; the workers hand
// their results to the coordinator when they finish.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_SEARCHCONTEXT_H_
#define ROTDIV_SEARCHCONTEXT_H_

#include <string>
#include <vector>
#include <cstdint>


// Result of generating and folding the pattern for one (multiplier, digit)
// pair

struct PatternRecord {
  unsigned multiplier = 0;
  unsigned digit = 0;
  unsigned period = 0;
  unsigned leading = 0;
  bool valid = false;
  std::uint64_t tail = 0;  // low digits of the block
  std::uint64_t repetitions = 0;
  std::uint64_t contribution = 0;  // zero for invalid patterns
  std::string block;  // full digit block, most significant first
};

struct SearchContext {
  // one record per (multiplier, digit) pair, in increasing order
  std::vector<PatternRecord> records;

  // number of valid patterns among `records`
  unsigned npatterns = 0;

  // sum of pattern contributions, modulo 10^5
  std::uint64_t pattern_sum = 0;

  // sum of repdigits (multiplier 1), modulo 10^5
  std::uint64_t repdigit_sum = 0;

  // final answer, modulo 10^5
  std::uint64_t result = 0;

  // wall clock time elapsed
  double secs_elapsed = 0;
};

#endif
