#include "greeting_cpp/greeting_oracle.hpp"

#include "greeting_cpp/cached_oracle.hpp"
#include "greeting_cpp/heuristic_oracle.hpp"
#include "greeting_cpp/remote_oracle.hpp"

using namespace std;


namespace greeting_cpp
{

shared_ptr<GreetingOracle> make_greeting_oracle(const OracleConfig & config)
{
  if (config.api_key.empty()) {
    return make_shared<HeuristicOracle>();
  }

  RemoteOracleConfig remote_cfg;
  remote_cfg.api_key = config.api_key;
  remote_cfg.url = config.url;
  remote_cfg.model = config.model;
  remote_cfg.timeout_sec = config.timeout_sec;
  remote_cfg.rate_limit_sec = config.rate_limit_sec;
  return make_shared<CachedOracle>(make_shared<RemoteOracle>(remote_cfg), config.cache_ttl_sec);
}

}  // namespace greeting_cpp
