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
  Sources of uniform random numbers for the samplers.

  random_source is the interface a sampler draws its rolls from.
  mt_random_source is a Mersenne Twister (Matsumoto and Nishimura)
  whose state is protected by a mutex, so one instance can be shared
  by several threads; each draw takes the lock once.  Seeding a
  source with a given value always reproduces the same sequence.

  shared_random_source() returns a process-wide mt_random_source,
  which is what samplers use when they aren't handed a source of their
  own.  It starts out seeded with the generator's default seed; call
  seed() on it to get a different (or reproducible) sequence.
*/

#ifndef _WSAMP_RANDOM_SOURCE_HPP
#define _WSAMP_RANDOM_SOURCE_HPP

#include <inttypes.h>
#include <wsamp/locker.hpp>

class random_source
{
public:
  virtual ~random_source() {}

  // reset the source's state; the sequence that follows depends only
  // on s
  virtual void seed(uint32_t s) = 0;

  // uniformly distributed on [0, 1); never returns 1.0
  virtual double uniform() = 0;
};


class mt_random_source : public random_source
{
public:

  // seed used when none is given
  static const uint32_t default_seed = 4357;

  mt_random_source(uint32_t s = default_seed);

  void seed(uint32_t s);
  double uniform();

  // uniformly distributed on [0, 2^32)
  uint32_t rand();

protected:

  enum { N = 624, M = 397 };

  uint32_t next_word(); // caller holds the lock
  void reseed(uint32_t s); // caller holds the lock

  mutex lock;
  uint32_t mt[N];
  int mti;

private:
  mt_random_source(const mt_random_source &);
  mt_random_source & operator=(const mt_random_source &);

};


mt_random_source & shared_random_source();

#endif // _WSAMP_RANDOM_SOURCE_HPP
