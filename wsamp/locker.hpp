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
  A pthread mutex that cleans up after itself, and the usual scoped
  locking object for it.  After a locker is constructed, the lock has
  been acquired.  When the locker goes out of context, the lock is
  released.
*/

#ifndef _WSAMP_LOCKER_HPP
#define _WSAMP_LOCKER_HPP

#include <pthread.h>
#include <wsamp/exceptions.hpp>

class mutex
{
public:

  mutex()
  {
    int rv = pthread_mutex_init(&M, 0);
    if(rv != 0)
      throw strerror_exception("Failed initializing mutex", rv);
  }

  ~mutex()
  {
    pthread_mutex_destroy(&M);
  }

  pthread_mutex_t & native() { return M; }

protected:
  pthread_mutex_t M;

private:
  mutex(const mutex &);             // no copy construction
  mutex & operator=(const mutex &); // no assignment

};


class locker
{
public:

  locker(mutex &m)
    : M(m.native())
  {
    int rv = pthread_mutex_lock(&M);
    if(rv != 0)
      throw strerror_exception("Failed acquiring lock", rv);
  }

  ~locker()
  {
    pthread_mutex_unlock(&M);
  }

protected:
  pthread_mutex_t &M;

};

#endif // _WSAMP_LOCKER_HPP
