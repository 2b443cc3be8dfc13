#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "greeting_cpp/cached_oracle.hpp"
#include "greeting_cpp/call_scheduler.hpp"
#include "greeting_cpp/greeting_oracle.hpp"
#include "greeting_cpp/heuristic_oracle.hpp"
#include "greeting_cpp/remote_oracle.hpp"
#include "transcript_cpp/context_buffer.hpp"

using namespace std::chrono_literals;
using greeting_cpp::CallScheduler;
using greeting_cpp::Judgment;

namespace
{

/// Manual steady clock; sleeping advances it
struct FakeClock
{
  CallScheduler::Clock::time_point now{};
  std::vector<CallScheduler::Clock::duration> sleeps;

  CallScheduler::NowFn now_fn()
  {
    return [this]() {return now;};
  }

  CallScheduler::SleepFn sleep_fn()
  {
    return [this](CallScheduler::Clock::duration d) {
             sleeps.push_back(d);
             now += d;
           };
  }
};

struct RecordedRequest
{
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  long timeout_sec = 0;
};

drop_common::HttpReply ok_reply(const std::string & content)
{
  drop_common::HttpReply reply;
  reply.transport_ok = true;
  reply.status = 200;
  reply.body = "{\"choices\":[{\"index\":0,\"message\":{\"role\":\"assistant\",\"content\":\"" +
    content + "\"}}]}";
  return reply;
}

class CountingOracle : public greeting_cpp::GreetingOracle
{
public:
  explicit CountingOracle(Judgment answer)
  : answer_(std::move(answer))
  {
  }

  Judgment judge(const std::string &) override
  {
    ++calls;
    return answer_;
  }

  std::string name() const override
  {
    return "counting";
  }

  int calls = 0;

private:
  Judgment answer_;
};

}  // namespace

TEST(HeuristicOracle, ClosingPhraseMakesGreetingComplete)
{
  greeting_cpp::HeuristicOracle oracle;
  EXPECT_TRUE(oracle.is_complete("Hi this is Mike please leave a message after the beep"));
  EXPECT_TRUE(oracle.is_complete("Thank you, goodbye"));
  EXPECT_FALSE(oracle.is_complete("Hello this is Mike"));
  EXPECT_FALSE(oracle.is_complete("You've reached Mike Rodriguez"));
  EXPECT_FALSE(oracle.is_complete(""));
}

TEST(HeuristicOracle, GreetingAssembledFromFragmentsIsComplete)
{
  transcript_cpp::ContextBuffer buffer;
  greeting_cpp::HeuristicOracle oracle;

  buffer.append("Hi this is Mike");
  ASSERT_EQ(buffer.current_context(), "Hi this is Mike");
  EXPECT_FALSE(oracle.judge(buffer.current_context()).complete);

  buffer.append(" please leave a message after the beep");
  const std::string context = buffer.current_context();
  EXPECT_EQ(context, "Hi this is Mike please leave a message after the beep");
  const Judgment j = oracle.judge(context);
  EXPECT_TRUE(j.available());
  EXPECT_TRUE(j.complete);
}

TEST(HeuristicOracle, SingleClosingPhraseWinsInLongText)
{
  greeting_cpp::HeuristicOracle oracle;
  const std::string text = "hi this is mike, my name is mike, i am out, goodbye";
  const auto score = oracle.score(text);
  EXPECT_EQ(score.complete, 1);
  EXPECT_EQ(score.incomplete, 3);
  EXPECT_TRUE(oracle.is_complete(text));
}

TEST(HeuristicOracle, ShortTextNeedsMajority)
{
  greeting_cpp::HeuristicOracle oracle;
  // "goodbye" alone: 7 characters, but complete still outnumbers incomplete
  EXPECT_TRUE(oracle.is_complete("goodbye"));
  EXPECT_FALSE(oracle.is_complete("I am"));
}

TEST(HeuristicOracle, JudgmentIsAlwaysAvailable)
{
  greeting_cpp::HeuristicOracle oracle;
  const Judgment j = oracle.judge("after the tone");
  EXPECT_TRUE(j.available());
  EXPECT_TRUE(j.complete);
  EXPECT_EQ(j.raw, "HEURISTIC");
}

TEST(CallScheduler, SpacesCallsByMinimumInterval)
{
  FakeClock clock;
  CallScheduler scheduler(2s, clock.now_fn(), clock.sleep_fn());

  EXPECT_EQ(scheduler.delay_before_next(clock.now), CallScheduler::Clock::duration::zero());
  scheduler.acquire();
  EXPECT_TRUE(clock.sleeps.empty());

  clock.now += 500ms;
  EXPECT_EQ(scheduler.delay_before_next(clock.now), std::chrono::duration_cast<CallScheduler::Clock::duration>(1500ms));
  scheduler.acquire();
  ASSERT_EQ(clock.sleeps.size(), 1u);
  EXPECT_EQ(clock.sleeps[0], std::chrono::duration_cast<CallScheduler::Clock::duration>(1500ms));

  clock.now += 3s;
  scheduler.acquire();
  EXPECT_EQ(clock.sleeps.size(), 1u);
}

TEST(CallScheduler, ResetForgetsLastCall)
{
  FakeClock clock;
  CallScheduler scheduler(2s, clock.now_fn(), clock.sleep_fn());
  scheduler.acquire();
  EXPECT_TRUE(scheduler.earliest_next().has_value());
  scheduler.reset();
  EXPECT_FALSE(scheduler.earliest_next().has_value());
  scheduler.acquire();
  EXPECT_TRUE(clock.sleeps.empty());
}

TEST(RemoteOracle, ParsesVerdictTokens)
{
  using greeting_cpp::RemoteOracle;
  EXPECT_EQ(RemoteOracle::parse_verdict("COMPLETE"), std::optional<bool>(true));
  EXPECT_EQ(RemoteOracle::parse_verdict("  complete\n"), std::optional<bool>(true));
  EXPECT_EQ(RemoteOracle::parse_verdict("Incomplete"), std::optional<bool>(false));
  EXPECT_FALSE(RemoteOracle::parse_verdict("COMPLETE.").has_value());
  EXPECT_FALSE(RemoteOracle::parse_verdict("maybe").has_value());
}

TEST(RemoteOracle, SendsOneChatRequestAndParsesReply)
{
  FakeClock clock;
  std::vector<RecordedRequest> requests;
  greeting_cpp::RemoteOracleConfig config;
  config.api_key = "secret-token";
  greeting_cpp::RemoteOracle oracle(
    config,
    [&requests](const std::string & url, const std::vector<std::string> & headers,
    const std::string & body, long timeout) {
      requests.push_back(RecordedRequest{url, headers, body, timeout});
      return ok_reply("COMPLETE");
    },
    std::make_unique<CallScheduler>(2s, clock.now_fn(), clock.sleep_fn()));

  const Judgment j = oracle.judge("say \"hi\" after the beep");
  EXPECT_TRUE(j.available());
  EXPECT_TRUE(j.complete);
  EXPECT_EQ(j.raw, "COMPLETE");

  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, config.url);
  EXPECT_EQ(requests[0].timeout_sec, 15);
  EXPECT_NE(
    std::find(requests[0].headers.begin(), requests[0].headers.end(), "Authorization: Bearer secret-token"),
    requests[0].headers.end());
  EXPECT_NE(requests[0].body.find("\"model\":\"openai/gpt-4.1\""), std::string::npos);
  EXPECT_NE(requests[0].body.find("\"max_tokens\":20"), std::string::npos);
  EXPECT_NE(requests[0].body.find("say \\\"hi\\\" after the beep"), std::string::npos);
}

TEST(RemoteOracle, FailuresAreUnavailable)
{
  FakeClock clock;
  greeting_cpp::RemoteOracleConfig config;
  config.api_key = "k";

  std::vector<drop_common::HttpReply> replies;
  drop_common::HttpReply timeout;
  timeout.timed_out = true;
  timeout.error = "curl_error:Timeout was reached";
  replies.push_back(timeout);

  drop_common::HttpReply server_error;
  server_error.transport_ok = true;
  server_error.status = 500;
  server_error.body = "oops";
  replies.push_back(server_error);

  drop_common::HttpReply garbage;
  garbage.transport_ok = true;
  garbage.status = 200;
  garbage.body = "{}";
  replies.push_back(garbage);

  replies.push_back(ok_reply("I think so"));

  size_t next = 0;
  greeting_cpp::RemoteOracle oracle(
    config,
    [&replies, &next](const std::string &, const std::vector<std::string> &, const std::string &, long) {
      return replies[next++];
    },
    std::make_unique<CallScheduler>(2s, clock.now_fn(), clock.sleep_fn()));

  const Judgment a = oracle.judge("leave a message");
  EXPECT_FALSE(a.available());
  EXPECT_EQ(a.error, "timeout");

  const Judgment b = oracle.judge("leave a message");
  EXPECT_FALSE(b.available());
  EXPECT_EQ(b.error, "http_500:oops");

  const Judgment c = oracle.judge("leave a message");
  EXPECT_FALSE(c.available());

  const Judgment d = oracle.judge("leave a message");
  EXPECT_FALSE(d.available());

  // four calls, each after the first waited for its slot
  EXPECT_EQ(clock.sleeps.size(), 3u);
}

TEST(RemoteOracle, MissingKeyIsUnavailableWithoutRequest)
{
  int calls = 0;
  greeting_cpp::RemoteOracle oracle(
    greeting_cpp::RemoteOracleConfig{},
    [&calls](const std::string &, const std::vector<std::string> &, const std::string &, long) {
      ++calls;
      return ok_reply("COMPLETE");
    });
  EXPECT_FALSE(oracle.judge("goodbye").available());
  EXPECT_EQ(calls, 0);
}

TEST(CachedOracle, ReusesRecentJudgment)
{
  FakeClock clock;
  auto inner = std::make_shared<CountingOracle>(Judgment::judged(true, "COMPLETE"));
  greeting_cpp::CachedOracle cached(inner, 60.0, clock.now_fn());

  EXPECT_TRUE(cached.judge("Please leave a message").complete);
  EXPECT_TRUE(cached.judge("  please LEAVE a message ").complete);
  EXPECT_EQ(inner->calls, 1);

  clock.now += 61s;
  EXPECT_TRUE(cached.judge("please leave a message").complete);
  EXPECT_EQ(inner->calls, 2);
}

TEST(CachedOracle, UnavailableIsNotCached)
{
  auto inner = std::make_shared<CountingOracle>(Judgment::unavailable("timeout"));
  greeting_cpp::CachedOracle cached(inner, 60.0);
  EXPECT_FALSE(cached.judge("goodbye").available());
  EXPECT_FALSE(cached.judge("goodbye").available());
  EXPECT_EQ(inner->calls, 2);
  EXPECT_EQ(cached.size(), 0u);
}

TEST(CachedOracle, KeyUsesFirstHundredCharacters)
{
  const std::string a = std::string(100, 'x') + "tail one";
  const std::string b = std::string(100, 'X') + "tail two";
  EXPECT_EQ(greeting_cpp::CachedOracle::cache_key(a), greeting_cpp::CachedOracle::cache_key(b));
}

TEST(OracleFactory, SelectsByCredential)
{
  greeting_cpp::OracleConfig config;
  EXPECT_EQ(greeting_cpp::make_greeting_oracle(config)->name(), "heuristic");
  config.api_key = "token";
  EXPECT_EQ(greeting_cpp::make_greeting_oracle(config)->name(), "cached(remote:openai/gpt-4.1)");
}
