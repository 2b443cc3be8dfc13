#pragma once

#include <memory>
#include <string>
#include <utility>

namespace greeting_cpp
{

enum class JudgmentStatus
{
  JUDGED,
  UNAVAILABLE
};

/// 완료 여부 질의 한 번의 결과. UNAVAILABLE이면 `error`에 이유가 담기고
/// 호출자가 다른 방법으로 판단해야 한다.
struct Judgment
{
  JudgmentStatus status = JudgmentStatus::UNAVAILABLE;
  bool complete = false;
  std::string raw;
  std::string error;

  bool available() const
  {
    return status == JudgmentStatus::JUDGED;
  }

  static Judgment judged(bool complete, std::string raw)
  {
    Judgment out;
    out.status = JudgmentStatus::JUDGED;
    out.complete = complete;
    out.raw = std::move(raw);
    return out;
  }

  static Judgment unavailable(std::string error)
  {
    Judgment out;
    out.status = JudgmentStatus::UNAVAILABLE;
    out.error = std::move(error);
    return out;
  }
};

/// 음성사서함 인사말 발췌가 끝났는지 판단
class GreetingOracle
{
public:
  virtual ~GreetingOracle() = default;

  virtual Judgment judge(const std::string & text) = 0;
  virtual std::string name() const = 0;
};

struct OracleConfig
{
  // 비어 있으면 heuristic만 사용
  std::string api_key;
  std::string url = "https://models.github.ai/inference/chat/completions";
  std::string model = "openai/gpt-4.1";
  long timeout_sec = 15;
  double rate_limit_sec = 2.0;
  double cache_ttl_sec = 60.0;
};

/// api_key가 있으면 캐시된 원격 모델, 없으면 키워드 heuristic
std::shared_ptr<GreetingOracle> make_greeting_oracle(const OracleConfig & config);

}  // namespace greeting_cpp
