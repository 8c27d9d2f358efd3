#include <gflags/gflags.h>
namespace gflags {
}

#include "DNS-collect.hpp"
#include "DNS.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <glog/logging.h>

DEFINE_bool(verbose, false, "trace each query, referral and cache hit");
DEFINE_uint64(timeout,
              Config::query_timeout.count(),
              "seconds to wait for each nameserver");
DEFINE_int32(max_referrals,
             Config::max_referrals,
             "referrals followed per query");
DEFINE_int32(max_depth,
             Config::max_depth,
             "nested lookups for glueless nameservers");
DEFINE_int32(max_chain, Config::max_chain, "aliases followed per name");

bool validate_limit(const char* flagname, int32_t value)
{
  if (value < 0) {
    LOG(ERROR) << "--" << flagname << " can't be negative: " << value;
    return false;
  }
  return true;
}

DEFINE_validator(max_referrals, &validate_limit);
DEFINE_validator(max_depth, &validate_limit);
DEFINE_validator(max_chain, &validate_limit);

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("itres [flags] name...");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  FLAGS_logtostderr = true;
  if (FLAGS_verbose)
    FLAGS_v = 1;
  else
    FLAGS_minloglevel = google::GLOG_ERROR;

  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    std::cerr << "usage: itres [flags] name...\n";
    return 1;
  }

  // Parse them all before sending anything.
  std::vector<Domain> names;
  for (int i = 1; i < argc; ++i) {
    std::string msg;
    Domain      dom;
    if (!Domain::validate(argv[i], msg, dom)) {
      std::cerr << "itres: " << msg << '\n';
      return 1;
    }
    names.push_back(dom);
  }

  DNS::Resolver::Options opts;
  opts.max_referrals = FLAGS_max_referrals;
  opts.max_depth     = FLAGS_max_depth;
  opts.max_chain     = FLAGS_max_chain;

  DNS::UDP_transport transport{std::chrono::seconds(FLAGS_timeout)};
  DNS::Cache         cache;
  DNS::Resolver      res{transport, cache, opts};

  for (auto const& name : names) {
    DNS::print_results(std::cout, DNS::collect(res, name));
    std::cout.flush();
  }

  VLOG(1) << cache.size() << " entries cached";
}
