#pragma once

#include <cstddef>
#include <string>

namespace transcript_cpp
{

struct ContextBufferConfig
{
  size_t window_chars = 200;
  size_t min_context_chars = 10;
};

/// 인사말 판단에 넘기는 최근 텍스트 window. 전체 transcript도 함께 보관
class ContextBuffer
{
public:
  explicit ContextBuffer(const ContextBufferConfig & config = ContextBufferConfig{});

  void append(const std::string & fragment);
  std::string current_context() const;
  void reset();

  const std::string & window() const;
  const std::string & transcript() const;

private:
  ContextBufferConfig config_;
  std::string window_;
  std::string transcript_;
};

}  // namespace transcript_cpp
