//
// Coordinator.cc
//
// Coordinator that manages the overall calculation.
//
// The (multiplier, digit) pairs are split among the worker threads up front;
// each worker generates its patterns independently and the coordinator folds
// the contributions once all workers have finished. The fold is a sum modulo
// 10^5, so the result does not depend on the number of threads or on the
// order in which workers complete.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "Coordinator.h"
#include "Pattern.h"
#include "Repdigits.h"
#include "WorkAssignment.h"

#include <iostream>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <format>
#include <stdexcept>


Coordinator::Coordinator(const SearchConfig& a, SearchContext& b,
    std::ostream& c)
    : config(a), context(b), rdout(c)
{}

Coordinator::~Coordinator()
{
  join_workers();
}

//------------------------------------------------------------------------------
// Execution entry point
//------------------------------------------------------------------------------

// Execute the calculation specified in `config`, storing results in `context`,
// and sending console output to `rdout`.
//
// Returns true on success, false on failure.

bool Coordinator::run()
{
  if (config.verboseflag) {
    print_search_description();
  }

  try {
    run_search();
  } catch (const std::overflow_error& oe) {
    rdout << "ERROR: Overflow occurred computing sum: " << oe.what() << '\n';
    return false;
  } catch (const std::runtime_error& re) {
    rdout << "ERROR: " << re.what() << '\n';
    return false;
  } catch (const std::logic_error& le) {
    rdout << "ERROR: " << le.what() << '\n';
    return false;
  }

  if (config.verboseflag) {
    print_pattern_table();
  }
  if (config.listflag) {
    print_patterns();
  }
  print_results();
  return true;
}

void Coordinator::run_search()
{
  const auto start = std::chrono::high_resolution_clock::now();
  if (config.verboseflag) {
    rdout << "Started on: " << current_time_string() << '\n';
  }

  context = {};
  try {
    start_workers();
  } catch (...) {
    // workers already launched must finish before the exception unwinds
    join_workers();
    throw;
  }
  stop_workers();
  collect_results();
  fold_results();

  const auto end = std::chrono::high_resolution_clock::now();
  context.secs_elapsed = calc_duration_secs(start, end);
}

//------------------------------------------------------------------------------
// Handle interactions with the Worker threads
//------------------------------------------------------------------------------

// Create the workers, divide the pairs among them, and start their threads.

void Coordinator::start_workers()
{
  const auto pairs = WorkAssignment::all_pairs();
  worker.clear();
  const auto num_workers = static_cast<unsigned>(
      std::min<size_t>(config.num_threads, pairs.size()));

  for (unsigned id = 0; id < num_workers; ++id) {
    worker.push_back(std::make_unique<Worker>(config, id));
  }
  for (size_t i = 0; i < pairs.size(); ++i) {
    worker.at(i % num_workers)->assignments.push_back(pairs.at(i));
  }

  for (unsigned id = 0; id < num_workers; ++id) {
    if (config.verboseflag) {
      rdout << std::format("worker {} starting with {} assignments\n", id,
          worker.at(id)->assignments.size());
    }
    worker_thread.push_back(launch_worker(*worker.at(id)));
  }
}

// Start a thread running `w`.
//
// If the thread cannot be created, throw a `std::system_error` exception.

std::unique_ptr<std::thread> Coordinator::launch_worker(Worker& w)
{
  return std::make_unique<std::thread>(&Worker::run, &w);
}

// Wait for every started worker thread to finish.

void Coordinator::join_workers()
{
  for (auto& thread : worker_thread) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
  worker_thread.clear();
}

// Wait for all worker threads to finish.

void Coordinator::stop_workers()
{
  join_workers();

  if (config.verboseflag) {
    for (const auto& w : worker) {
      rdout << std::format("worker {} finished in {:.4f} sec\n", w->get_id(),
          w->secs_working);
    }
  }
}

// Gather pattern records from the workers into `context`, in (multiplier,
// digit) order. If any worker failed, rethrow its exception.

void Coordinator::collect_results()
{
  for (const auto& w : worker) {
    if (w->error) {
      std::rethrow_exception(w->error);
    }
    context.records.insert(context.records.end(), w->results.cbegin(),
        w->results.cend());
  }
  worker.clear();

  std::ranges::sort(context.records,
      [](const PatternRecord& a, const PatternRecord& b) {
        return (a.multiplier < b.multiplier ||
            (a.multiplier == b.multiplier && a.digit < b.digit));
      });
}

// Sum the pattern contributions and the repdigits.
//
// In the event of a math overflow error, throw a `std::overflow_error`
// exception with a relevant error message.

void Coordinator::fold_results()
{
  for (const auto& rec : context.records) {
    if (rec.valid) {
      ++context.npatterns;
    }
    context.pattern_sum =
        (context.pattern_sum + rec.contribution) % Pattern::MODULUS;
  }

  context.repdigit_sum = Repdigits::repdigit_sum(config.exponent);
  context.result =
      (context.pattern_sum + context.repdigit_sum) % Pattern::MODULUS;
}

//------------------------------------------------------------------------------
// Handle terminal output
//------------------------------------------------------------------------------

void Coordinator::print_search_description() const
{
  rdout << std::format("sum of n in (10, 10^{}) dividing their right rotation,"
                       " modulo {}\n", config.exponent, Pattern::MODULUS)
        << std::format("workers: {}\n", std::min<size_t>(config.num_threads,
                         WorkAssignment::all_pairs().size()));
}

// Print one line per (multiplier, digit) pair.

void Coordinator::print_pattern_table() const
{
  rdout << "   mult  digit  period  low digits   reps  contrib   block\n";

  for (const auto& rec : context.records) {
    if (rec.valid) {
      rdout << std::format("   {:4}  {:5}  {:6}  {:>10}  {:5}  {:7}   {}\n",
          rec.multiplier, rec.digit, rec.period, rec.tail, rec.repetitions,
          rec.contribution, rec.block);
    } else {
      rdout << std::format("   {:4}  {:5}  {:6}  {:>10}  {:>5}  {:>7}   {}\n",
          rec.multiplier, rec.digit, rec.period, "-", "-", "-", rec.block);
    }
  }
}

// Print the digit block of every pattern that contributes to the sum, i.e.
// valid and short enough to fit below 10^exponent.

void Coordinator::print_patterns() const
{
  for (const auto& rec : context.records) {
    if (rec.valid && rec.repetitions > 0) {
      rdout << rec.block << '\n';
    }
  }
}

void Coordinator::print_results() const
{
  if (config.verboseflag) {
    rdout << std::format("valid patterns: {} of {}\n", context.npatterns,
               context.records.size())
          << std::format("pattern sum: {}\n", context.pattern_sum)
          << std::format("repdigit sum: {}\n", context.repdigit_sum)
          << std::format("runtime = {:.4f} sec\n", context.secs_elapsed)
          << "Finished on: " << current_time_string() << '\n';
  }
  rdout << context.result << std::endl;
}

std::string Coordinator::current_time_string()
{
  const auto now = std::chrono::system_clock::now();
  const auto now_timet = std::chrono::system_clock::to_time_t(now);
  char* now_str = std::ctime(&now_timet);
  now_str[strlen(now_str) - 1] = '\0';  // remove trailing carriage return
  return now_str;
}

//------------------------------------------------------------------------------
// Utility methods
//------------------------------------------------------------------------------

double Coordinator::calc_duration_secs(const rdtimer_t& before,
    const rdtimer_t& after)
{
  const std::chrono::duration<double> diff = after - before;
  return diff.count();
}
