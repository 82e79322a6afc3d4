//
// rotdiv_tests.cc
//
// Collection of tests for rotdiv functionality.
//
// Copyright (C) 1998-2025 Jack Boyce, <jboyce@gmail.com>
//
// This file is distributed under the MIT License.
//

#include "SearchConfig.h"
#include "SearchContext.h"
#include "Coordinator.h"
#include "Pattern.h"
#include "Repdigits.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <thread>
#include <system_error>
#include <utility>
#include <cstdint>
#include <cstdlib>
#include <format>


// Individual record for a full calculation test case

struct TestCase {
  // command line input
  std::string input;

  // expected results
  std::uint64_t result;
  std::uint64_t pattern_sum;
  std::uint64_t repdigit_sum;
  unsigned npatterns;
};

const std::vector<TestCase> tests {
  { "rotdiv",                       59206,  4201, 55005, 36 },
  { "rotdiv -exp 1",                    0,     0,     0, 36 },
  { "rotdiv -exp 2",                  495,     0,   495, 36 },
  { "rotdiv -exp 3",                 5490,     0,  5490, 36 },
  { "rotdiv -exp 6",                98331, 42856, 55475, 36 },
  { "rotdiv -exp 7",                98326, 42856, 55470, 36 },
  { "rotdiv -exp 13",               75329, 19889, 55440, 36 },
  { "rotdiv -exp 50",               93539, 38284, 55255, 36 },
  { "rotdiv -exp 1000",             21895, 71390, 50505, 36 },
  { "rotdiv -exp 1000000",           5631, 50126, 55505, 36 },
};

// Individual record for a single pattern test case

struct PatternCase {
  unsigned multiplier;
  unsigned digit;

  // expected results
  unsigned period;
  bool valid;
  std::uint64_t tail;
  std::string block;
};

const std::vector<PatternCase> pattern_tests {
  { 5, 7,  6, true,  42857, "142857" },
  { 2, 1, 18, false, 68421, "052631578947368421" },
  { 2, 2, 18, true,  36842, "105263157894736842" },
  { 4, 4,  6, true,   2564, "102564" },
  { 4, 1,  6, false, 25641, "025641" },
  { 8, 9, 13, true,   6329, "1139240506329" },
  { 3, 3, 28, true,  13793, "1034482758620689655172413793" },
  { 9, 9, 44, true,  24719, "10112359550561797752808988764044943820224719" },
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

// Return the sum modulo 10^5 of all n in (10, 10^exponent) that divide their
// right rotation, by checking every n. Only practical for small exponents.

std::uint64_t brute_force_sum(unsigned exponent)
{
  std::uint64_t limit = 1;
  for (unsigned i = 0; i < exponent; ++i) {
    limit *= 10;
  }

  std::uint64_t sum = 0;
  std::uint64_t pow10 = 10;  // 10^(number of digits of n - 1)
  for (std::uint64_t n = 11; n < limit; ++n) {
    if (n >= pow10 * 10) {
      pow10 *= 10;
    }
    const std::uint64_t rotation = (n % 10) * pow10 + n / 10;
    if (rotation % n == 0) {
      sum = (sum + n) % Pattern::MODULUS;
    }
  }
  return sum;
}

// Multiply a decimal digit string by a single digit `m`.

std::string multiply_digits(const std::string& s, unsigned m)
{
  std::string result;
  unsigned carry = 0;
  for (auto it = s.crbegin(); it != s.crend(); ++it) {
    const unsigned val = static_cast<unsigned>(*it - '0') * m + carry;
    result.insert(result.begin(), static_cast<char>('0' + val % 10));
    carry = val / 10;
  }
  if (carry > 0) {
    result.insert(result.begin(), static_cast<char>('0' + carry));
  }
  return result;
}

// Run the full calculation for `input`, returning true on success.

bool run_calculation(const std::string& input, SearchContext& context,
    std::string& output)
{
  SearchConfig config;
  try {
    config.from_args(input);
  } catch (const std::invalid_argument& ie) {
    std::cout << "Error parsing test input: " << ie.what() << '\n';
    return false;
  }

  std::ostringstream buffer;
  Coordinator coordinator(config, context, buffer);
  const bool success = coordinator.run();
  output = buffer.str();
  return success;
}

//------------------------------------------------------------------------------
// Individual tests
//------------------------------------------------------------------------------

// Run a single calculation test case with one and with four threads, and
// compare against known values.
//
// Return true on test pass, false on failure.

bool run_one_test(const TestCase& tc)
{
  std::cout << std::format("Executing: {}\n", tc.input)
            << "               result,  pattern sum,  repdigit sum,  patterns\n"
            << std::format("target     {:6},  {:11},  {:12},  {:8}", tc.result,
                 tc.pattern_sum, tc.repdigit_sum, tc.npatterns)
            << std::endl;

  bool success = true;

  for (const unsigned threads : {1u, 4u}) {
    SearchContext context;
    std::string output;
    if (!run_calculation(std::format("{} -threads {}", tc.input, threads),
          context, output)) {
      std::cout << "TEST FAILED TO EXECUTE: " << output << std::endl;
      success = false;
      continue;
    }

    std::cout << std::format("threads {}  {:6},  {:11},  {:12},  {:8}",
                   threads, context.result, context.pattern_sum,
                   context.repdigit_sum, context.npatterns)
              << std::endl;

    if (context.result != tc.result || context.pattern_sum != tc.pattern_sum ||
        context.repdigit_sum != tc.repdigit_sum ||
        context.npatterns != tc.npatterns || context.records.size() != 72) {
      success = false;
    }
    if (output != std::format("{}\n", tc.result)) {
      std::cout << "unexpected output: " << output << std::endl;
      success = false;
    }
  }

  return success;
}

// Generate a single pattern and compare against known values.

bool run_pattern_test(const PatternCase& pc)
{
  std::cout << std::format("Pattern: multiplier {}, digit {}\n", pc.multiplier,
                 pc.digit)
            << std::format("target     period {:2}, valid {:5}, tail {:5}, {}",
                 pc.period, pc.valid, pc.tail, pc.block)
            << std::endl;

  const Pattern pat(pc.multiplier, pc.digit);
  std::cout << std::format("actual     period {:2}, valid {:5}, tail {:5}, {}",
                 pat.period(), pat.is_valid(), pat.tail_value(),
                 pat.to_string())
            << std::endl;

  bool success = (pat.period() == pc.period && pat.is_valid() == pc.valid &&
      pat.tail_value() == pc.tail && pat.to_string() == pc.block &&
      pat.tail().at(0) == pc.digit &&
      pat.make_analysis().find(pc.block) != std::string::npos);

  // the rotation is the block times the multiplier, for both the block and
  // a repetition of it
  const auto block = pat.to_string();
  const auto doubled = block + block;
  for (const auto& digits : {block, doubled}) {
    const auto rotation = digits.back() + digits.substr(0, digits.size() - 1);
    if (multiply_digits(digits, pc.multiplier) != rotation) {
      std::cout << std::format("{} x {} != {}", digits, pc.multiplier,
                     rotation)
                << std::endl;
      success = false;
    }
  }

  if (pc.valid) {
    const auto contribution = pat.contribution(100);
    const auto expected = (pc.tail * (100 / pc.period)) % Pattern::MODULUS;
    if (contribution != expected) {
      std::cout << std::format("contribution {} != {}", contribution, expected)
                << std::endl;
      success = false;
    }
  } else if (pat.contribution(100) != 0) {
    std::cout << "rejected pattern contributed to sum" << std::endl;
    success = false;
  }
  return success;
}

// Compare the pattern-based result against brute force for exponents 2-7.

bool run_brute_force_test()
{
  bool success = true;

  for (unsigned exponent = 2; exponent <= 7; ++exponent) {
    SearchContext context;
    std::string output;
    if (!run_calculation(std::format("rotdiv -exp {}", exponent), context,
          output)) {
      return false;
    }
    const auto expected = brute_force_sum(exponent);
    std::cout << std::format("exponent {}:  patterns {:5},  brute force {:5}",
                   exponent, context.result, expected)
              << std::endl;
    if (context.result != expected) {
      success = false;
    }
  }
  return success;
}

// Check the iterative repdigit sum against the closed form for 10^100, and
// the repunit residues.

bool run_repdigit_test()
{
  const auto closed = Repdigits::closed_form_sum();
  const auto iterative = Repdigits::repdigit_sum(100);
  std::cout << std::format("closed form {}, iterative {}", closed, iterative)
            << std::endl;

  bool success = (closed == iterative && closed == 55005);
  success = success && Repdigits::repunit_residue(1) == 1;
  success = success && Repdigits::repunit_residue(4) == 1111;
  success = success && Repdigits::repunit_residue(5) == 11111;
  success = success && Repdigits::repunit_residue(99) == 11111;
  success = success && Repdigits::repdigit_sum(1) == 0;
  success = success && Repdigits::repdigit_sum(2) == 495;
  return success;
}

// Running the calculation twice gives identical results.

bool run_repeat_test()
{
  SearchContext context1;
  SearchContext context2;
  std::string output1;
  std::string output2;
  if (!run_calculation("rotdiv -threads 3", context1, output1) ||
      !run_calculation("rotdiv -threads 3", context2, output2)) {
    return false;
  }
  std::cout << std::format("first run {}, second run {}", context1.result,
                 context2.result)
            << std::endl;
  return (output1 == output2 && context1.result == context2.result &&
      context1.records.size() == context2.records.size());
}

// Bad input is reported as an exception, not silently accepted.

bool run_input_test()
{
  bool success = true;

  for (const std::string input : {"rotdiv -exp 0", "rotdiv -exp x",
      "rotdiv -threads 0", "rotdiv -threads", "rotdiv -bogus"}) {
    SearchConfig config;
    try {
      config.from_args(input);
      std::cout << "accepted bad input: " << input << std::endl;
      success = false;
    } catch (const std::invalid_argument& ie) {
      std::cout << std::format("{}: {}", input, ie.what()) << std::endl;
    }
  }

  for (const auto& [m, d] : std::vector<std::pair<unsigned, unsigned>>{
      {1, 5}, {10, 5}, {5, 0}, {5, 10}}) {
    try {
      const Pattern pat(m, d);
      std::cout << std::format("accepted bad pattern ({},{})", m, d)
                << std::endl;
      success = false;
    } catch (const std::invalid_argument& ie) {
      std::cout << ie.what() << std::endl;
    }
  }
  return success;
}

// Coordinator whose thread creation fails after `limit` workers have started,
// as when the system runs out of threads.

class LimitedThreadCoordinator : public Coordinator {
 public:
  LimitedThreadCoordinator(const SearchConfig& config, SearchContext& context,
      std::ostream& rdout, unsigned limit)
      : Coordinator(config, context, rdout), limit(limit)
  {}

  unsigned launched = 0;

 private:
  const unsigned limit;

  std::unique_ptr<std::thread> launch_worker(Worker& w) override
  {
    if (launched == limit) {
      throw std::system_error(
          std::make_error_code(std::errc::resource_unavailable_try_again),
          "failed to start worker thread");
    }
    ++launched;
    return Coordinator::launch_worker(w);
  }
};

// A worker thread that fails to start is reported as an error, after the
// workers already running have been joined.

bool run_thread_failure_test()
{
  SearchConfig config;
  config.from_args("rotdiv -threads 4");

  SearchContext context;
  std::ostringstream buffer;
  bool success = true;
  {
    LimitedThreadCoordinator coordinator(config, context, buffer, 2);
    if (coordinator.run()) {
      std::cout << "run succeeded despite thread failure" << std::endl;
      success = false;
    }
    if (coordinator.launched != 2) {
      std::cout << std::format("launched {} workers", coordinator.launched)
                << std::endl;
      success = false;
    }
  }

  const auto output = buffer.str();
  std::cout << "output: " << output;
  if (output.find("ERROR: ") != 0 ||
      output.find("failed to start worker thread") == std::string::npos) {
    success = false;
  }
  return success;
}

// -list prints only the blocks short enough to repeat below 10^exponent.

bool run_list_test()
{
  SearchContext context;
  std::string output;
  if (!run_calculation("rotdiv -exp 7 -list -threads 2", context, output)) {
    return false;
  }
  std::cout << output;

  const std::string expected =
      "102564\n128205\n153846\n179487\n205128\n230769\n142857\n98326\n";
  return output == expected;
}

//------------------------------------------------------------------------------
// Test driver
//------------------------------------------------------------------------------

// Execute test number `testnum` (numbered from 1), or all tests if `testnum`
// is -1, and report on results.
//
// Returns EXIT_SUCCESS if every test executed passed.

int do_tests(int testnum)
{
  std::vector<std::function<bool()>> testlist;
  for (const auto& tc : tests) {
    testlist.push_back([&tc]() { return run_one_test(tc); });
  }
  for (const auto& pc : pattern_tests) {
    testlist.push_back([&pc]() { return run_pattern_test(pc); });
  }
  testlist.push_back(run_brute_force_test);
  testlist.push_back(run_repdigit_test);
  testlist.push_back(run_repeat_test);
  testlist.push_back(run_input_test);
  testlist.push_back(run_thread_failure_test);
  testlist.push_back(run_list_test);

  int runs = 0;
  int passes = 0;

  for (size_t i = 0; i < testlist.size(); ++i) {
    if (testnum != -1 && static_cast<size_t>(testnum) != i + 1)
      continue;

    ++runs;
    std::cout << std::format("\nStarting test {}:\n\n", i + 1);
    if (testlist.at(i)()) {
      ++passes;
      std::cout << "Test succeeded\n" << std::endl;
    } else {
      std::cout
          << "TEST FAILED ################################################\n"
          << std::endl;
    }
  }

  std::cout << "------------------------------------------------------------\n"
            << std::format("Passed {} out of {} tests", passes, runs)
            << std::endl;
  return (runs > 0 && passes == runs) ? EXIT_SUCCESS : EXIT_FAILURE;
}
