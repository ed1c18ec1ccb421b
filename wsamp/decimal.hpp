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
  Exact base-10 numbers for probabilities.

  Probabilities like 0.1 have no exact binary representation, so
  summing them in doubles rarely lands on exactly 1.0.  decimal_t
  holds 50 significant decimal digits; sums and comparisons of
  probabilities written with fewer digits than that are exact.
*/

#ifndef _WSAMP_DECIMAL_HPP
#define _WSAMP_DECIMAL_HPP

#include <inttypes.h>
#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>

typedef boost::multiprecision::cpp_dec_float_50 decimal_t;

enum decimal_parse_result
{
  decimal_ok,
  decimal_malformed,    // not a real number literal
  decimal_out_of_range  // a real number, but its exponent is beyond decimal_t
};

// parse a real number literal ("0.3", ".5", "-1e-2") into d exactly.
// d is only written on decimal_ok.  a nonzero literal too small for
// decimal_t is out of range rather than rounded to zero.
decimal_parse_result parse_decimal(const std::string &str, decimal_t &d);

// parse a (signed, 64-bit) integer literal.  "3.0" is not an integer.
bool parse_integer(const std::string &str, int64_t &v);

// the decimal a double was most likely written as: the shortest
// rendition (DBL_DIG to max_digits10 significant digits) that reads
// back as the same double.  0.1 gives exactly 0.1, while
// 0.1000000000000001 keeps its last digit.  NaN and infinities come
// back as decimal_t NaN and infinities.
decimal_t decimal_from_double(double v);

#endif // _WSAMP_DECIMAL_HPP
