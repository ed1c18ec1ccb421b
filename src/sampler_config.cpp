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

#include <wsamp/sampler_config.hpp>
#include <wsamp/exceptions.hpp>
#include <sstream>
#include <limits>
#include <boost/spirit/include/classic.hpp>
#include <boost/program_options.hpp>

namespace bs = boost::spirit::classic;
namespace po = boost::program_options;

typedef bs::file_iterator<char> iterator_t;
typedef bs::scanner<iterator_t> scanner_t;
typedef bs::rule<scanner_t> rule_t;


template <class Iterator>
struct config_begin_group
{
  config_begin_group(sampler_config_parser &P) : P(P) {}

  void operator()(Iterator start, Iterator end) const
  {
    P.begin_group(std::string(start, end));
  }

  sampler_config_parser &P;
};

template <class Iterator>
struct config_end_group
{
  config_end_group(sampler_config_parser &P) : P(P) {}

  void operator()(Iterator start, Iterator end) const
  {
    P.end_group();
  }

  sampler_config_parser &P;
};

template <class Iterator>
struct config_append
{
  config_append(sampler_config_parser &P) : P(P) {}

  void operator()(Iterator start, Iterator end) const
  {
    P.group_body.append(start, end);
  }

  sampler_config_parser &P;
};


std::vector<std::string> split_list(const std::string &str)
{
  std::string s(str);
  for(std::string::iterator i = s.begin(); i != s.end(); ++i)
    if(*i == ',')
      *i = ' ';

  std::vector<std::string> tokens;
  std::istringstream ss(s);
  std::string tok;
  while(ss >> tok)
    tokens.push_back(tok);

  return tokens;
}

uint32_t checked_uint32(const std::string &option, int64_t v)
{
  if(v < 0 || v > (int64_t)std::numeric_limits<uint32_t>::max()) {
    std::ostringstream ss;
    ss << option << " must be between 0 and "
       << std::numeric_limits<uint32_t>::max() << ", not " << v;
    throw config_exception(ss.str());
  }
  return (uint32_t)v;
}

void sampler_config_parser::begin_group(const std::string &type)
{
  group_type = type;
  group_body.clear();
}

void sampler_config_parser::end_group()
{
  if(group_type == "sampler") {
    std::istringstream ss(group_body);
    read_sampler(ss);
  }

  // anything else is silently ignored
  group_type.clear();
  group_body.clear();
}

void sampler_config_parser::read_sampler(std::istream &is)
{
  sampler_config c;
  std::string outcomes, probabilities;
  int64_t draws = c.draws, seed = 0;

  po::options_description opt;
  opt.add_options()
    ("name", po::value<std::string>(&c.name))
    ("outcomes", po::value<std::string>(&outcomes)->required())
    ("probabilities", po::value<std::string>(&probabilities)->required())
    ("draws", po::value<int64_t>(&draws))
    ("seed", po::value<int64_t>(&seed));

  po::variables_map vm;
  try {
    po::store(po::parse_config_file(is, opt), vm);
    po::notify(vm);

    c.draws = checked_uint32("draws", draws);
    c.seed = checked_uint32("seed", seed);
  }
  catch(po::error &e) {
    std::ostringstream ss;
    ss << "sampler #" << S.size() + 1 << ": " << e.what();
    throw config_exception(ss.str());
  }
  catch(config_exception &e) {
    std::ostringstream ss;
    ss << "sampler #" << S.size() + 1 << ": " << e.reason();
    throw config_exception(ss.str());
  }

  if(c.name.empty()) {
    std::ostringstream ss;
    ss << "sampler" << S.size() + 1;
    c.name = ss.str();
  }

  c.seeded = vm.count("seed") > 0;
  c.outcomes = split_list(outcomes);
  c.probabilities = split_list(probabilities);

  S.push_back(c);
}

bool sampler_config_parser::parse(const char *path)
{
  // open the file in a spirit-compatible way
  iterator_t first(path);
  if(!first)
    return false;
  iterator_t last = first.make_end();

  // actors
  config_begin_group<iterator_t> g_begin(*this);
  config_end_group<iterator_t> g_end(*this);
  config_append<iterator_t> g_append(*this);

  // set up our EBNF rules and call the parser
  rule_t ws, var_name, assignment, group, config_file;
  ws = *(bs::space_p | bs::comment_p("#"));
  var_name = (bs::alpha_p | bs::ch_p('_'))
    >> *(bs::alnum_p | bs::ch_p('_') | bs::ch_p('.'));
  assignment = ws
    >> (var_name >> ws
        >> bs::ch_p('=') >> ws
        >> *(bs::anychar_p - bs::eol_p)
        >> bs::eol_p) [g_append];
  group = ws
    >> var_name [g_begin] >> ws
    >> bs::ch_p('{') >> ws
    >> *assignment >> ws
    >> bs::ch_p('}')
    >> ws;
  config_file = *(group [g_end]) >> ws;

  return bs::parse(first, last, config_file).full;
}
