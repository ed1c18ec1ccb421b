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

#include <assert.h>
#include <algorithm>
#include <sstream>
#include <wsamp/weighted_sampler.hpp>
#include <wsamp/exceptions.hpp>

static std::string size_mismatch_reason(size_t outcomes, size_t probabilities)
{
  std::ostringstream ss;
  ss << outcomes << " outcomes but " << probabilities << " probabilities";
  return ss.str();
}

static std::string element_reason(const char *what, uint32_t i,
                                  const std::string &value)
{
  std::ostringstream ss;
  ss << what << " at index " << i << ": '" << value << "'";
  return ss.str();
}

weighted_sampler::weighted_sampler(const std::vector<int64_t> &outcomes,
                                   const std::vector<double> &probabilities,
                                   random_source &R)
  : R(R), O(outcomes)
{
  if(outcomes.size() != probabilities.size())
    throw length_mismatch
      (size_mismatch_reason(outcomes.size(), probabilities.size()));

  P.reserve(probabilities.size());
  for(uint32_t i = 0; i < probabilities.size(); ++i) {
    decimal_t p = decimal_from_double(probabilities[i]);
    check_probability(p, i);
    P.push_back(p);
  }

  build_cumulative();
}

weighted_sampler::weighted_sampler(const std::vector<std::string> &outcomes,
                                   const std::vector<std::string> &probabilities,
                                   random_source &R)
  : R(R)
{
  if(outcomes.size() != probabilities.size())
    throw length_mismatch
      (size_mismatch_reason(outcomes.size(), probabilities.size()));

  uint32_t i;

  P.reserve(probabilities.size());
  for(i = 0; i < probabilities.size(); ++i) {
    decimal_t p;
    switch(parse_decimal(probabilities[i], p)) {
    case decimal_malformed:
      throw invalid_probability_type
        (element_reason("probability is not a real number", i,
                        probabilities[i]), i);
    case decimal_out_of_range:
      throw invalid_probability
        (element_reason("probability exponent out of range", i,
                        probabilities[i]), i);
    case decimal_ok:
      break;
    }
    check_probability(p, i);
    P.push_back(p);
  }

  O.reserve(outcomes.size());
  for(i = 0; i < outcomes.size(); ++i) {
    int64_t v;
    if(!parse_integer(outcomes[i], v))
      throw invalid_outcome_type
        (element_reason("outcome is not an integer", i, outcomes[i]), i);
    O.push_back(v);
  }

  build_cumulative();
}

void weighted_sampler::check_probability(const decimal_t &p, uint32_t i)
{
  // written this way round so NaN fails too
  if(!(p >= 0 && p <= 1))
    throw invalid_probability
      (element_reason("probability outside [0, 1]", i, p.str()), i);
}

void weighted_sampler::build_cumulative()
{
  if(P.empty())
    throw probability_sum_error("no outcomes to sample from");

  decimal_t sum = 0;
  C.reserve(P.size());
  for(uint32_t i = 0; i < P.size(); ++i) {
    sum += P[i];
    C.push_back(sum);
  }

  // the one and only sum check: the table must end in exactly 1 for
  // every roll in [0, 1) to land in some bucket
  if(C.back() != 1)
    throw probability_sum_error
      ("probabilities sum to " + C.back().str() + ", not 1");
}

int64_t weighted_sampler::next() const
{
  return O[cumulative_index(C, R.uniform())];
}

double weighted_sampler::probability_of(int64_t outcome) const
{
  decimal_t p = 0;
  for(uint32_t i = 0; i < O.size(); ++i)
    if(O[i] == outcome)
      p += P[i];

  return p.convert_to<double>();
}

uint32_t cumulative_index(const std::vector<decimal_t> &C, double roll)
{
  const decimal_t r(roll);

  std::vector<decimal_t>::const_iterator i =
    std::upper_bound(C.begin(), C.end(), r);

  // can only happen if C doesn't end in 1 or roll isn't below 1
  assert(i != C.end());

  return i - C.begin();
}
