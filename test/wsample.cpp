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
#include <time.h>
#include <inttypes.h>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <iostream>
#include <boost/program_options.hpp>
#include <wsamp/sampler_config.hpp>
#include <wsamp/weighted_sampler.hpp>
#include <wsamp/exceptions.hpp>

namespace po = boost::program_options;

// draw from one configured sampler and print what came out next to
// what should have
void run(const sampler_config &C)
{
  mt_random_source R(C.seeded ? C.seed : (uint32_t)time(0));
  weighted_sampler S(C.outcomes, C.probabilities, R);

  std::map<int64_t, uint32_t> counts;
  for(uint32_t i = 0; i < C.draws; ++i)
    ++counts[S.next()];

  printf("%s: %u outcomes, %u draws\n", C.name.c_str(), S.size(), C.draws);

  // print each distinct outcome once, in the order given
  std::vector<int64_t> distinct;
  std::set<int64_t> seen;
  for(uint32_t i = 0; i < S.size(); ++i)
    if(seen.insert(S.outcomes()[i]).second)
      distinct.push_back(S.outcomes()[i]);

  printf("expected [outcome: frequency]:\n");
  for(uint32_t i = 0; i < distinct.size(); ++i)
    printf("  %" PRId64 ": %.0f times\n", distinct[i],
           S.probability_of(distinct[i]) * C.draws);

  printf("actual [outcome: frequency (proportion)]:\n");
  for(uint32_t i = 0; i < distinct.size(); ++i) {
    uint32_t n = counts[distinct[i]];
    printf("  %" PRId64 ": %u times (%f)\n", distinct[i], n,
           C.draws ? double(n) / C.draws : 0.0);
  }
  printf("\n");
}

int main(int argc, char **argv)
{
  std::string cfg, outcomes, probabilities;
  int64_t draws, seed = 0;
  sampler_config C;

  po::options_description opt("Options");
  opt.add_options()
    ("help,h", "show this message")
    ("config,c", po::value<std::string>(&cfg), "sampler config file")
    ("outcomes,o", po::value<std::string>(&outcomes),
     "outcomes, e.g. \"-1 0 1 2 3\"")
    ("probabilities,p", po::value<std::string>(&probabilities),
     "probabilities, e.g. \"0.01 0.3 0.58 0.1 0.01\"")
    ("draws,n", po::value<int64_t>(&draws)->default_value(10000),
     "number of draws")
    ("seed,s", po::value<int64_t>(&seed), "random seed");

  po::positional_options_description pos;
  pos.add("config", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
              .options(opt).positional(pos).run(), vm);
    po::notify(vm);
  }
  catch(po::error &e) {
    fprintf(stderr, "%s\n", e.what());
    std::cerr << opt;
    return 1;
  }

  if(vm.count("help") || (cfg.empty() && outcomes.empty())) {
    printf("Usage: %s <cfg file>\n"
           "       %s -o <outcomes> -p <probabilities> [-n draws] [-s seed]\n",
           argv[0], argv[0]);
    std::cout << opt;
    return vm.count("help") ? 0 : 1;
  }

  try {
    if(!cfg.empty()) {
      sampler_config_parser CP;
      if(!CP.parse(cfg.c_str())) {
        fprintf(stderr, "failed to parse %s\n", cfg.c_str());
        return 1;
      }
      for(uint32_t i = 0; i < CP.samplers().size(); ++i)
        run(CP.samplers()[i]);
    }
    else {
      C.name = "command line";
      C.draws = checked_uint32("draws", draws);
      C.seed = checked_uint32("seed", seed);
      C.outcomes = split_list(outcomes);
      C.probabilities = split_list(probabilities);
      C.seeded = vm.count("seed") > 0;
      run(C);
    }
  }
  catch(string_exception &e) {
    fprintf(stderr, "%s\n", e.reason().c_str());
    return 1;
  }

  return 0;
}
