#pragma once

#include <optional>
#include <string>

namespace transcript_cpp
{

/// 분석 중인 스트림의 증분 텍스트. 구현체가 스스로 호출 빈도를 제한하고
/// reset()에서 처음부터 다시 시작한다.
class TranscriptionSource
{
public:
  virtual ~TranscriptionSource() = default;

  virtual std::optional<std::string> next_fragment(double total_duration, double elapsed_time) = 0;
  virtual void reset() = 0;
};

}  // namespace transcript_cpp
