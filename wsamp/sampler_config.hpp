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
  A parser for configuration files declaring one or more samplers:

    # comment
    sampler {
      name = loaded_die
      outcomes = 1 2 3 4 5 6
      probabilities = 0.1 0.2 0.3 0.2 0.1 0.1
      draws = 100000
      seed = 10
    }

    sampler {
      ...
    }

  The group structure is parsed with boost::spirit; the "name = value"
  assignments within a group are handed to boost's program_options as
  a config file of their own, which takes care of type conversions.
  Groups of any type other than "sampler" are skipped.

  Outcome and probability lists are split on whitespace and commas
  but otherwise left as text; weighted_sampler's string constructor
  does the validation.
*/

#ifndef _WSAMP_SAMPLER_CONFIG_HPP
#define _WSAMP_SAMPLER_CONFIG_HPP

#include <inttypes.h>
#include <string>
#include <vector>
#include <istream>

template <class Iterator> struct config_begin_group;
template <class Iterator> struct config_end_group;
template <class Iterator> struct config_append;


struct sampler_config
{
  sampler_config() : draws(10000), seed(0), seeded(false) {}

  std::string name;
  std::vector<std::string> outcomes;
  std::vector<std::string> probabilities;
  uint32_t draws;
  uint32_t seed;
  bool seeded; // was a seed given?
};


// split a list like "1, 2 3" into its tokens
std::vector<std::string> split_list(const std::string &str);

// draws and seed are read as signed numbers so that a negative value
// is caught here instead of wrapping around; this throws
// config_exception unless v fits a uint32_t.
uint32_t checked_uint32(const std::string &option, int64_t v);


class sampler_config_parser
{
public:

  // parse the config file at the given path, appending a
  // sampler_config for each sampler group.  returns false if the file
  // can't be read or isn't well formed; throws config_exception if a
  // sampler group contains an unknown or malformed assignment.
  bool parse(const char *path);

  const std::vector<sampler_config> & samplers() const { return S; }

protected:

  std::vector<sampler_config> S;

  std::string group_type;  // type of the group being parsed
  std::string group_body;  // assignments seen so far in that group

  void begin_group(const std::string &type);
  void end_group();
  void read_sampler(std::istream &is);

  template <class Iterator> friend struct config_begin_group;
  template <class Iterator> friend struct config_end_group;
  template <class Iterator> friend struct config_append;

};

#endif // _WSAMP_SAMPLER_CONFIG_HPP
