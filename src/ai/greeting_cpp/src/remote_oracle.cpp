#include "greeting_cpp/remote_oracle.hpp"

#include <drop_common/json_utils.hpp>
#include <drop_common/string_utils.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

using namespace std;


namespace greeting_cpp
{
namespace
{

static const drop_common::CurlGlobalGuard curl_guard;

}  // namespace

RemoteOracle::RemoteOracle(
  const RemoteOracleConfig & config, HttpPost http_post, unique_ptr<CallScheduler> scheduler)
: config_(config), http_post_(move(http_post)), scheduler_(move(scheduler))
{
  if (!http_post_) {
    http_post_ = drop_common::post_json;
  }
  if (!scheduler_) {
    scheduler_ = make_unique<CallScheduler>(
      chrono::duration_cast<CallScheduler::Clock::duration>(
        chrono::duration<double>(config_.rate_limit_sec)));
  }
}

string RemoteOracle::build_prompt(const string & text)
{
  ostringstream prompt;
  prompt << "Analyze this voicemail greeting excerpt to determine if the speaker has finished "
         << "their greeting and is ready for a message.\n\n"
         << "Greeting excerpt: \"" << text << "\"\n\n"
         << "Respond with ONLY 'COMPLETE' or 'INCOMPLETE'.";
  return prompt.str();
}

string RemoteOracle::build_request_body(const string & text) const
{
  ostringstream body;
  body << "{"
       << "\"model\":\"" << drop_common::json_escape(config_.model) << "\","
       << "\"temperature\":" << config_.temperature << ","
       << "\"top_p\":" << config_.top_p << ","
       << "\"max_tokens\":" << config_.max_tokens << ","
       << "\"messages\":["
       << "{\"role\":\"user\",\"content\":\"" << drop_common::json_escape(build_prompt(text)) << "\"}"
       << "]"
       << "}";
  return body.str();
}

optional<bool> RemoteOracle::parse_verdict(const string & content)
{
  const string token = drop_common::to_upper(drop_common::trim(content));
  if (token == "COMPLETE") {
    return true;
  }
  if (token == "INCOMPLETE") {
    return false;
  }
  return nullopt;
}

Judgment RemoteOracle::judge(const string & text)
{
  if (config_.api_key.empty()) {
    return Judgment::unavailable("api_key_empty");
  }

  scheduler_->acquire();

  const vector<string> headers{
    "Content-Type: application/json",
    "Authorization: Bearer " + config_.api_key};
  const drop_common::HttpReply reply =
    http_post_(config_.url, headers, build_request_body(text), config_.timeout_sec);

  if (!reply.transport_ok) {
    const string error = reply.timed_out ? "timeout" : "network_error:" + reply.error;
    cerr << "[greeting_cpp] remote oracle failed: " << error << endl;
    return Judgment::unavailable(error);
  }

  if (reply.status != 200) {
    ostringstream err;
    err << "http_" << reply.status;
    if (!reply.body.empty()) {
      err << ":" << drop_common::trim(reply.body);
    }
    cerr << "[greeting_cpp] remote oracle failed: " << err.str() << endl;
    return Judgment::unavailable(err.str());
  }

  string content;
  if (!drop_common::extract_json_string_field(reply.body, "content", content)) {
    cerr << "[greeting_cpp] remote oracle returned no content" << endl;
    return Judgment::unavailable("invalid_response:" + drop_common::trim(reply.body));
  }

  const optional<bool> verdict = parse_verdict(content);
  const string raw = drop_common::to_upper(drop_common::trim(content));
  if (!verdict) {
    cerr << "[greeting_cpp] unexpected verdict: " << raw << endl;
    return Judgment::unavailable("malformed_verdict:" + raw);
  }
  return Judgment::judged(*verdict, raw);
}

string RemoteOracle::name() const
{
  return "remote:" + config_.model;
}

}  // namespace greeting_cpp
