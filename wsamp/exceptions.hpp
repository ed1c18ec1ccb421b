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
  Exception classes.  Everything thrown by the library derives from
  string_exception, so callers can catch that one type and print
  reason().
*/

#ifndef _WSAMP_EXCEPTIONS_HPP
#define _WSAMP_EXCEPTIONS_HPP

#include <string.h>
#include <inttypes.h>
#include <string>

class string_exception
{
public:

  string_exception() : m_reason("Unspecified") {}
  string_exception(std::string r) : m_reason(r) {}

  const std::string & reason() const { return m_reason; }

protected:
  std::string m_reason;

};

class strerror_exception : public string_exception
{
public:

  strerror_exception(std::string r, int e)
    : string_exception(r + ": " + strerror(e)) {}
};

class config_exception : public string_exception
{
public:
  config_exception(std::string r) : string_exception(r) {}
};


// rejected weighted_sampler input.  index() is the position of the
// offending element, or -1 when the error concerns the input as a
// whole.
class sampler_exception : public string_exception
{
public:

  sampler_exception(std::string r, int64_t i = -1)
    : string_exception(r), m_index(i) {}

  int64_t index() const { return m_index; }

protected:
  int64_t m_index;
};

class length_mismatch : public sampler_exception
{
public:
  length_mismatch(std::string r) : sampler_exception(r) {}
};

class invalid_outcome_type : public sampler_exception
{
public:
  invalid_outcome_type(std::string r, int64_t i)
    : sampler_exception(r, i) {}
};

class invalid_probability_type : public sampler_exception
{
public:
  invalid_probability_type(std::string r, int64_t i)
    : sampler_exception(r, i) {}
};

class invalid_probability : public sampler_exception
{
public:
  invalid_probability(std::string r, int64_t i)
    : sampler_exception(r, i) {}
};

class probability_sum_error : public sampler_exception
{
public:
  probability_sum_error(std::string r) : sampler_exception(r) {}
};

#endif // _WSAMP_EXCEPTIONS_HPP
