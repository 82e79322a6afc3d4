//
// SearchConfig.h
//
// This structure defines the calculation requested by the user, as specified
// by command line arguments.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#ifndef ROTDIV_SEARCHCONFIG_H_
#define ROTDIV_SEARCHCONFIG_H_

#include <string>


struct SearchConfig {
  // sum numbers n in the range 10 < n < 10^exponent
  unsigned exponent = 100;

  // number of worker threads to use
  unsigned num_threads = 1;

  // print every valid pattern found?
  bool listflag = false;

  // print search description, per-pattern table, and timing?
  bool verboseflag = false;

  static constexpr unsigned MAX_EXPONENT = 1000000;

  // methods to initialize from command line arguments
  void from_args(size_t argc, char** argv);
  void from_args(const std::string& str);
};

#endif
