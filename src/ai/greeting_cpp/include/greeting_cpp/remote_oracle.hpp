#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <drop_common/curl_utils.hpp>

#include "greeting_cpp/call_scheduler.hpp"
#include "greeting_cpp/greeting_oracle.hpp"

namespace greeting_cpp
{

struct RemoteOracleConfig
{
  std::string api_key;
  std::string url = "https://models.github.ai/inference/chat/completions";
  std::string model = "openai/gpt-4.1";
  double temperature = 0.3;
  double top_p = 0.9;
  int max_tokens = 20;
  long timeout_sec = 15;
  double rate_limit_sec = 2.0;
};

/// COMPLETE 또는 INCOMPLETE로 답하도록 요청하는 chat-completions 모델.
/// 전송 오류, 200이 아닌 응답, 두 단어 외의 답은 모두 UNAVAILABLE.
class RemoteOracle : public GreetingOracle
{
public:
  using HttpPost = std::function<drop_common::HttpReply(
      const std::string & url,
      const std::vector<std::string> & headers,
      const std::string & body,
      long timeout_sec)>;

  explicit RemoteOracle(
    const RemoteOracleConfig & config,
    HttpPost http_post = nullptr,
    std::unique_ptr<CallScheduler> scheduler = nullptr);

  Judgment judge(const std::string & text) override;
  std::string name() const override;

  std::string build_request_body(const std::string & text) const;
  static std::string build_prompt(const std::string & text);
  static std::optional<bool> parse_verdict(const std::string & content);

private:
  RemoteOracleConfig config_;
  HttpPost http_post_;
  std::unique_ptr<CallScheduler> scheduler_;
};

}  // namespace greeting_cpp
