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

#include <wsamp/decimal.hpp>
#include <float.h>
#include <stdio.h>
#include <stdlib.h>
#include <limits>
#include <stdexcept>
#include <boost/spirit/include/classic.hpp>
#include <boost/spirit/include/classic_actor.hpp>

namespace bs = boost::spirit::classic;

// does the literal have a nonzero digit before its exponent?
static bool nonzero_mantissa(const std::string &str)
{
  for(std::string::const_iterator i = str.begin(); i != str.end(); ++i) {
    if(*i == 'e' || *i == 'E')
      break;
    if(*i >= '1' && *i <= '9')
      return true;
  }
  return false;
}

decimal_parse_result parse_decimal(const std::string &str, decimal_t &d)
{
  // let spirit decide what counts as a real number, then hand the
  // digits themselves to decimal_t so nothing passes through binary
  // floating point
  if(!bs::parse(str.c_str(), bs::real_p).full)
    return decimal_malformed;

  bool nonzero = nonzero_mantissa(str);
  decimal_t parsed;
  try {
    parsed = decimal_t(str.c_str());
  }
  catch(std::runtime_error &) {
    // decimal_t refuses exponents that don't fit its exponent type;
    // only a zero mantissa makes such a literal meaningful
    if(nonzero)
      return decimal_out_of_range;
    parsed = 0;
  }

  // exponents below decimal_t's range quietly become zero
  if(nonzero && parsed == 0)
    return decimal_out_of_range;

  d = parsed;
  return decimal_ok;
}

bool parse_integer(const std::string &str, int64_t &v)
{
  int64_t parsed;
  if(!bs::parse(str.c_str(),
                bs::int_parser<int64_t>()[bs::assign_a(parsed)]).full)
    return false;

  v = parsed;
  return true;
}

decimal_t decimal_from_double(double v)
{
  char buf[64];
  for(int prec = DBL_DIG; ; ++prec) {
    snprintf(buf, sizeof(buf), "%.*g", prec, v);
    if(prec >= std::numeric_limits<double>::max_digits10
       || strtod(buf, 0) == v)
      break;
  }
  return decimal_t(buf);
}
