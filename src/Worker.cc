//
// Worker.cc
//
// Worker that executes work assignments given to it by the Coordinator.
//
// Each assignment is independent of every other, so the worker simply maps
// its list of (multiplier, digit) pairs to pattern records. Nothing is shared
// with other workers while the thread runs.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "Worker.h"
#include "Pattern.h"

#include <chrono>


Worker::Worker(const SearchConfig& config, unsigned id)
    : config(config), worker_id(id)
{}

//------------------------------------------------------------------------------
// Execution entry point
//------------------------------------------------------------------------------

// Process all assignments. Any exception is captured in `error` for the
// coordinator to rethrow once the thread has been joined.

void Worker::run()
{
  const auto start = std::chrono::high_resolution_clock::now();

  try {
    for (const auto& wa : assignments) {
      results.push_back(do_work_assignment(wa));
    }
  } catch (...) {
    error = std::current_exception();
  }

  const auto end = std::chrono::high_resolution_clock::now();
  const std::chrono::duration<double> diff = end - start;
  secs_working = diff.count();
}

unsigned Worker::get_id() const
{
  return worker_id;
}

// Generate the pattern for one pair and compute its contribution.

PatternRecord Worker::do_work_assignment(const WorkAssignment& wa) const
{
  const Pattern pat(wa.multiplier, wa.digit);

  PatternRecord rec;
  rec.multiplier = pat.get_multiplier();
  rec.digit = pat.get_digit();
  rec.period = pat.period();
  rec.leading = pat.leading_digit();
  rec.valid = pat.is_valid();
  rec.repetitions = pat.repetitions(config.exponent);
  if (rec.valid) {
    rec.tail = pat.tail_value();
    rec.contribution = pat.contribution(config.exponent);
  }
  if (config.listflag || config.verboseflag) {
    rec.block = pat.to_string();
  }
  return rec;
}
