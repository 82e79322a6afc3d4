//
// rotdiv.cc
//
// This program finds the last five digits of the sum of all integers n, with
// 10 < n < 10^100, that divide their own right-rotation. The right-rotation
// moves the last digit to the front: 142857 rotates to 714285 = 5 * 142857.
//
// Rather than testing 100-digit numbers, it generates for each multiplier
// 2-9 and each least significant digit 1-9 the unique repeating digit block
// with that property, and adds up the low digits of all its repetitions. The
// repdigits 11, 222, ... (multiplier 1) are summed separately.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "SearchConfig.h"
#include "SearchContext.h"
#include "Coordinator.h"
#include "Pattern.h"

#include <iostream>
#include <cstring>
#include <cstdlib>
#include <string>
#include <stdexcept>
#include <format>


int do_tests(int testnum = -1);  // defined in rotdiv_tests.cc

//------------------------------------------------------------------------------
// Help message
//------------------------------------------------------------------------------

void print_help()
{
  static const std::string help_string =
    "rotdiv version 1.0 (2025.06.02)\n"
    "\n"
    "This program computes the last five digits of the sum of all integers n,\n"
    "10 < n < 10^100, that are divisors of their right rotation (the number\n"
    "with its last digit moved to the front).\n"
    "\n"
    "Recognized command line formats:\n"
    "   rotdiv [options]\n"
    "   rotdiv -analyze <multiplier> <digit>\n"
    "   rotdiv -test [<testnum>]\n"
    "   rotdiv -help\n"
    "\n"
    "where:\n"
    "   <multiplier>       = ratio of rotation to number, 2-9\n"
    "   <digit>            = least significant digit, 1-9\n"
    "\n"
    "Recognized options:\n"
    "   -exp <E>           sum over 10 < n < 10^E instead (default 100)\n"
    "   -list              print every pattern that contributes to the sum\n"
    "   -verbose           print a table of all patterns, and timing\n"
    "   -threads <num>     generate patterns using <num> threads (default 1)\n"
    "\n"
    "Examples:\n"
    "   rotdiv\n"
    "   rotdiv -exp 7 -list\n"
    "   rotdiv -analyze 5 7\n\n";

  std::cout << help_string;
}

//------------------------------------------------------------------------------
// Pattern analysis
//------------------------------------------------------------------------------

int print_analysis(int argc, char** argv)
{
  if (argc != 4) {
    std::cerr << "Usage: rotdiv -analyze <multiplier> <digit>\n";
    return EXIT_FAILURE;
  }

  try {
    const int m = std::stoi(argv[2]);
    const int d = std::stoi(argv[3]);
    if (m < 0 || d < 0) {
      throw std::invalid_argument("Inputs must be non-negative");
    }
    const Pattern pat(static_cast<unsigned>(m), static_cast<unsigned>(d));
    std::cout << pat.make_analysis();
  } catch (const std::invalid_argument& ie) {
    std::cout << std::format("Error analyzing input: {} {}\n{}\n", argv[2],
                   argv[3], ie.what());
    return EXIT_FAILURE;
  } catch (const std::out_of_range& oor) {
    std::cout << std::format("Error analyzing input: {} {}\n{}\n", argv[2],
                   argv[3], oor.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

//------------------------------------------------------------------------------
// Execution entry point
//------------------------------------------------------------------------------

int main(int argc, char** argv)
{
  if (argc > 1 && strcmp(argv[1], "-test") == 0) {
    if (argc > 2) {
      return do_tests(std::stoi(argv[2]));
    }
    return do_tests();
  }

  if (argc > 1 && strcmp(argv[1], "-help") == 0) {
    print_help();
    return EXIT_SUCCESS;
  }

  if (argc > 1 && strcmp(argv[1], "-analyze") == 0) {
    return print_analysis(argc, argv);
  }

  SearchConfig config;
  try {
    config.from_args(argc, argv);
  } catch (const std::invalid_argument& ie) {
    std::cerr << ie.what() << '\n';
    return EXIT_FAILURE;
  }

  SearchContext context;
  Coordinator coordinator(config, context, std::cout);
  if (!coordinator.run()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
