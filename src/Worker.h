//
// Worker.h
//
// Worker that executes work assignments given to it by the Coordinator.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_WORKER_H_
#define ROTDIV_WORKER_H_

#include "SearchConfig.h"
#include "SearchContext.h"
#include "WorkAssignment.h"

#include <vector>
#include <exception>


class Worker {
 public:
  Worker(const SearchConfig& config, unsigned id);
  Worker() = delete;

 private:
  // set during construction and do not change
  const SearchConfig config;
  const unsigned worker_id;

 public:
  // filled in by the coordinator before the worker thread starts
  std::vector<WorkAssignment> assignments;

  // read by the coordinator after the worker thread is joined
  std::vector<PatternRecord> results;
  std::exception_ptr error;
  double secs_working = 0;

  void run();
  unsigned get_id() const;

 private:
  PatternRecord do_work_assignment(const WorkAssignment& wa) const;
};

#endif
