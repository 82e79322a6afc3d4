//
// SearchConfig.cc
//
// Methods for intializing a SearchConfig structure from command line arguments.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "SearchConfig.h"

#include <sstream>
#include <vector>
#include <format>
#include <stdexcept>
#include <cstring>


// Initialize SearchConfig from command line arguments. argv[0] is the program
// name and is skipped.
//
// In the event of an error, throw a `std::invalid_argument` exception with a
// relevant error message.

void SearchConfig::from_args(size_t argc, char** argv) {
  int val;

  for (size_t i = 1; i < argc; ++i) {
    if (!strcmp(argv[i], "-verbose")) {
      verboseflag = true;
    } else if (!strcmp(argv[i], "-list")) {
      listflag = true;
    } else if (!strcmp(argv[i], "-exp")) {
      if (i + 1 < argc) {
        ++i;
        try {
          val = std::stoi(argv[i]);
        } catch (const std::logic_error& le) {
          (void)le;
          throw std::invalid_argument(
              std::format("Error parsing exponent: {}", argv[i]));
        }
        if (val < 1 || static_cast<unsigned>(val) > MAX_EXPONENT) {
          throw std::invalid_argument(
              std::format("Exponent must be in the range 1-{}",
                  MAX_EXPONENT));
        }
        exponent = static_cast<unsigned>(val);
      } else {
        throw std::invalid_argument("No number provided after -exp");
      }
    } else if (!strcmp(argv[i], "-threads")) {
      if (i + 1 < argc) {
        ++i;
        try {
          val = std::stoi(argv[i]);
        } catch (const std::logic_error& le) {
          (void)le;
          throw std::invalid_argument(
              std::format("Error parsing number of threads: {}", argv[i]));
        }
        if (val < 1) {
          throw std::invalid_argument("Must have at least one worker thread");
        }
        num_threads = static_cast<unsigned>(val);
      } else {
        throw std::invalid_argument("No number provided after -threads");
      }
    } else {
      throw std::invalid_argument(
          std::format("Unrecognized input: {}", argv[i]));
    }
  }
}

// Initialize SearchConfig from concatenated command line arguments.
//
// In the event of an error, throw a `std::invalid_argument` exception with a
// relevant error message.

void SearchConfig::from_args(const std::string& str) {
  // tokenize the argslist string
  std::stringstream ss(str);
  std::string s;
  std::vector<std::string> args;
  while (std::getline(ss, s, ' ')) {
    if (!s.empty()) {
      args.push_back(s);
    }
  }

  const size_t argc = args.size();
  std::vector<char*> argv;
  for (size_t i = 0; i < argc; ++i) {
    argv.push_back(&(args[i][0]));
  }

  from_args(argc, argv.data());
}
