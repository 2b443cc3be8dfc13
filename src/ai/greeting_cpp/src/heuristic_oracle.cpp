#include "greeting_cpp/heuristic_oracle.hpp"

#include <drop_common/string_utils.hpp>

using namespace std;


namespace greeting_cpp
{

HeuristicOracle::HeuristicOracle(const HeuristicConfig & config)
: config_(config)
{
}

IndicatorScore HeuristicOracle::score(const string & text) const
{
  const string lower = drop_common::to_lower(text);
  IndicatorScore out;
  for (const auto & phrase : config_.complete_indicators) {
    if (drop_common::contains(lower, phrase)) {
      ++out.complete;
    }
  }
  for (const auto & phrase : config_.incomplete_indicators) {
    if (drop_common::contains(lower, phrase)) {
      ++out.incomplete;
    }
  }
  return out;
}

bool HeuristicOracle::is_complete(const string & text) const
{
  const IndicatorScore s = score(text);
  // 닫는 문구가 하나라도 있으면 여는 문구가 여럿이어도 완료로 본다
  return s.complete > s.incomplete ||
         (s.complete > 0 && text.size() > config_.min_length_for_single_indicator);
}

Judgment HeuristicOracle::judge(const string & text)
{
  return Judgment::judged(is_complete(text), "HEURISTIC");
}

string HeuristicOracle::name() const
{
  return "heuristic";
}

}  // namespace greeting_cpp
