//
// Coordinator.h
//
// Coordinator that manages the overall calculation: it hands out the
// (multiplier, digit) pairs to worker threads, folds their contributions
// together with the repdigit sum, and reports the result.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_COORDINATOR_H_
#define ROTDIV_COORDINATOR_H_

#include "SearchConfig.h"
#include "SearchContext.h"
#include "Worker.h"

#include <vector>
#include <string>
#include <memory>
#include <thread>
#include <chrono>
#include <iostream>


using rdtimer_t = std::chrono::time_point<std::chrono::high_resolution_clock>;


class Coordinator {
 public:
  Coordinator(const SearchConfig& config, SearchContext& context,
    std::ostream& rdout);
  Coordinator() = delete;
  virtual ~Coordinator();

 protected:
  const SearchConfig& config;
  SearchContext& context;
  std::ostream& rdout;  // all console output goes here

  // workers
  std::vector<std::unique_ptr<Worker>> worker;
  std::vector<std::unique_ptr<std::thread>> worker_thread;

 public:
  bool run();

 protected:
  virtual std::unique_ptr<std::thread> launch_worker(Worker& w);

 private:
  void run_search();
  void start_workers();
  void stop_workers();
  void join_workers();
  void collect_results();
  void fold_results();

  // handle terminal output
  void print_search_description() const;
  void print_pattern_table() const;
  void print_patterns() const;
  void print_results() const;
  static std::string current_time_string();

 public:
  // utility methods
  static double calc_duration_secs(const rdtimer_t& before,
    const rdtimer_t& after);
};

#endif
