#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "greeting_cpp/greeting_oracle.hpp"

namespace greeting_cpp
{

struct HeuristicConfig
{
  std::vector<std::string> complete_indicators{
    "leave a message",
    "after the beep",
    "after the tone",
    "call me back",
    "thank you",
    "goodbye",
    "leave your name",
    "i'll call you",
    "message after",
    "beep and then",
  };
  std::vector<std::string> incomplete_indicators{
    "hi this is",
    "hello this is",
    "you've reached",
    "i am",
    "my name is",
    "i'm not available",
    "sorry i missed",
  };
  size_t min_length_for_single_indicator = 10;
};

struct IndicatorScore
{
  int complete = 0;
  int incomplete = 0;
};

/// 키워드 점수. 닫는 문구가 여는 문구보다 많거나,
/// 10자를 넘는 텍스트에 닫는 문구가 하나라도 있으면 완료.
class HeuristicOracle : public GreetingOracle
{
public:
  explicit HeuristicOracle(const HeuristicConfig & config = HeuristicConfig{});

  Judgment judge(const std::string & text) override;
  std::string name() const override;

  IndicatorScore score(const std::string & text) const;
  bool is_complete(const std::string & text) const;

private:
  HeuristicConfig config_;
};

}  // namespace greeting_cpp
