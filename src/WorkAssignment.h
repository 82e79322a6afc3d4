//
// WorkAssignment.h
//
// A single unit of work handed to a Worker: one (multiplier, least significant
// digit) pair whose pattern is to be generated and folded.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_WORKASSIGNMENT_H_
#define ROTDIV_WORKASSIGNMENT_H_

#include <vector>


struct WorkAssignment {
  unsigned multiplier = 0;
  unsigned digit = 0;

  // all pairs with multiplier 2-9 and digit 1-9, in increasing order
  static std::vector<WorkAssignment> all_pairs();
};

inline std::vector<WorkAssignment> WorkAssignment::all_pairs()
{
  std::vector<WorkAssignment> pairs;
  for (unsigned m = 2; m < 10; ++m) {
    for (unsigned d = 1; d < 10; ++d) {
      pairs.push_back({m, d});
    }
  }
  return pairs;
}

#endif
