/*
  Copyright 2008-2012 Kristopher R Beevers and Internap Network
  Services Corporation.

  Permission is hereby granted, free of charge, to any person
  obtaining a copy of this software and associated documentation files
  (the "Software"), to deal in the Software without restriction,
  including without limitation the rights to use, copy, modify, merge,
  publish, distribute, sublicense, and/or sell copies of the Software,
  and to permit persons to whom the Software is furnished to do so,
  subject to the following conditions:

  The above copyright notice and this permission notice shall be
  included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
  NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
  BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
  ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
  CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

/*
  A sampler for drawing integer outcomes according to a fixed discrete
  probability mass function, given as two parallel lists: the outcomes
  and the probability of each.

  Probabilities are kept as exact decimals (see decimal.hpp), so they
  must add up to exactly 1: 0.1 ten times is fine, 1/3 three times
  (0.333333333333333 each) is not.  The constructor validates its
  input and throws one of the sampler_exception types from
  exceptions.hpp, checking in this order:

    1. both lists have the same length             (length_mismatch)
    2. each probability, in order, is a real number
       (invalid_probability_type) in [0, 1] whose
       exponent decimal_t can hold                 (invalid_probability)
    3. each outcome, in order, is an integer       (invalid_outcome_type)
    4. the probabilities sum to exactly 1          (probability_sum_error)

  Type errors are only possible with the string constructor, which is
  meant for values read from config files or command lines.

  Sampling is a binary search of a uniform roll over the cumulative
  probabilities, so it costs O(log N) per draw.  A roll landing exactly
  on a cumulative boundary selects the following outcome.  The sampler
  is immutable once built; next() may be called from several threads
  at once provided the random source tolerates that (mt_random_source
  does).
*/

#ifndef _WSAMP_WEIGHTED_SAMPLER_HPP
#define _WSAMP_WEIGHTED_SAMPLER_HPP

#include <inttypes.h>
#include <string>
#include <vector>
#include <wsamp/decimal.hpp>
#include <wsamp/random_source.hpp>

class weighted_sampler
{
public:

  weighted_sampler(const std::vector<int64_t> &outcomes,
                   const std::vector<double> &probabilities,
                   random_source &R = shared_random_source());

  weighted_sampler(const std::vector<std::string> &outcomes,
                   const std::vector<std::string> &probabilities,
                   random_source &R = shared_random_source());

  // draw one outcome
  int64_t next() const;

  // total probability of drawing the given value (duplicated outcomes
  // add up); 0 if it isn't one of the outcomes
  double probability_of(int64_t outcome) const;

  uint32_t size() const { return O.size(); }

  const std::vector<int64_t> & outcomes() const { return O; }
  const std::vector<decimal_t> & probabilities() const { return P; }
  const std::vector<decimal_t> & cumulative() const { return C; }

protected:

  void check_probability(const decimal_t &p, uint32_t i);
  void build_cumulative();

  random_source &R;
  std::vector<int64_t>   O;
  std::vector<decimal_t> P;
  std::vector<decimal_t> C;
};


// index of the first entry of the cumulative table C that is strictly
// greater than roll.  C must be non-decreasing and end in 1; roll must
// be in [0, 1).
uint32_t cumulative_index(const std::vector<decimal_t> &C, double roll);

#endif // _WSAMP_WEIGHTED_SAMPLER_HPP
