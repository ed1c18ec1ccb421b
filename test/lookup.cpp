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

#include <stdio.h>
#include <assert.h>
#include <string>
#include <vector>
#include <wsamp/weighted_sampler.hpp>

#define VEC(T, a) std::vector<T>(a, a + sizeof(a) / sizeof(a[0]))

// hands out a fixed list of rolls, starting over when reseeded
class scripted_source : public random_source
{
public:
  scripted_source(const std::vector<double> &rolls)
    : rolls(rolls), pos(0) {}

  void seed(uint32_t s) { pos = 0; }

  double uniform()
  {
    assert(pos < rolls.size());
    return rolls[pos++];
  }

protected:
  std::vector<double> rolls;
  uint32_t pos;
};

std::vector<decimal_t> table(const char **entries, uint32_t n)
{
  std::vector<decimal_t> C;
  for(uint32_t i = 0; i < n; ++i)
    C.push_back(decimal_t(entries[i]));
  return C;
}

void test_boundaries()
{
  const char *entries[] = { "0.1", "0.3", "1.0" };
  std::vector<decimal_t> C = table(entries, 3);

  assert(cumulative_index(C, 0.0) == 0);
  assert(cumulative_index(C, 0.09999999999999999) == 0);

  // a roll equal to a boundary belongs to the next bucket
  assert(cumulative_index(C, 0.1) == 1);
  assert(cumulative_index(C, 0.2) == 1);

  // the double nearest 0.3 is just below it
  assert(cumulative_index(C, 0.3) == 1);
  assert(cumulative_index(C, 0.30000000000000004) == 2);

  assert(cumulative_index(C, 0.5) == 2);
  assert(cumulative_index(C, 0.9999999999999999) == 2);
}

void test_dyadic_boundaries()
{
  // boundaries a double represents exactly, so rolls really do hit
  // them
  const char *entries[] = { "0.25", "0.5", "0.75", "1" };
  std::vector<decimal_t> C = table(entries, 4);

  assert(cumulative_index(C, 0.0) == 0);
  assert(cumulative_index(C, 0.25) == 1);
  assert(cumulative_index(C, 0.5) == 2);
  assert(cumulative_index(C, 0.75) == 3);
  assert(cumulative_index(C, 0.7499999999999999) == 2);
}

void test_zero_mass_buckets()
{
  // empty leading bucket is skipped even by a zero roll
  const char *leading[] = { "0", "0.5", "1" };
  std::vector<decimal_t> C = table(leading, 3);
  assert(cumulative_index(C, 0.0) == 1);
  assert(cumulative_index(C, 0.4999999999999999) == 1);
  assert(cumulative_index(C, 0.5) == 2);

  // empty middle bucket
  const char *middle[] = { "0.5", "0.5", "1" };
  C = table(middle, 3);
  assert(cumulative_index(C, 0.4999999999999999) == 0);
  assert(cumulative_index(C, 0.5) == 2);

  // empty trailing bucket can never be reached
  const char *trailing[] = { "0.5", "1", "1" };
  C = table(trailing, 3);
  assert(cumulative_index(C, 0.9999999999999999) == 1);
}

void test_large_table()
{
  const uint32_t N = 1000;
  std::vector<std::string> outcomes, probs(N, "0.001");
  for(uint32_t i = 0; i < N; ++i) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u", i);
    outcomes.push_back(buf);
  }

  weighted_sampler S(outcomes, probs);
  assert(S.cumulative().back() == 1);

  // the middle of every bucket
  for(uint32_t i = 0; i < N; ++i)
    assert(cumulative_index(S.cumulative(), (i + 0.5) / N) == i);

  assert(cumulative_index(S.cumulative(), 0.0) == 0);
  assert(cumulative_index(S.cumulative(), 0.9999999999999999) == N - 1);
}

void test_next_uses_rolls()
{
  const int64_t outcomes[] = { 1, 2, 3 };
  const double probs[] = { 0.1, 0.2, 0.7 };
  const double rolls[] = { 0.0, 0.1, 0.31, 0.05, 0.9999999999999999, 0.29 };
  const int64_t expected[] = { 1, 2, 3, 1, 3, 2 };

  scripted_source R(VEC(double, rolls));
  weighted_sampler S(VEC(int64_t, outcomes), VEC(double, probs), R);

  for(uint32_t i = 0; i < 6; ++i)
    assert(S.next() == expected[i]);

  // same rolls, same outcomes
  R.seed(0);
  for(uint32_t i = 0; i < 6; ++i)
    assert(S.next() == expected[i]);
}

int main(int argc, char **argv)
{
  printf("boundaries\n");
  test_boundaries();
  printf("dyadic boundaries\n");
  test_dyadic_boundaries();
  printf("zero mass buckets\n");
  test_zero_mass_buckets();
  printf("large table\n");
  test_large_table();
  printf("next() follows the rolls\n");
  test_next_uses_rolls();

  printf("lookup: all passed\n");
  return 0;
}
