#include "transcript_cpp/context_buffer.hpp"

using namespace std;


namespace transcript_cpp
{

ContextBuffer::ContextBuffer(const ContextBufferConfig & config)
: config_(config)
{
}

void ContextBuffer::append(const string & fragment)
{
  if (fragment.empty()) {
    return;
  }
  transcript_ += fragment;
  window_ += fragment;
  if (window_.size() > config_.window_chars) {
    window_.erase(0, window_.size() - config_.window_chars);
  }
}

/// window가 min_context_chars보다 길면 window, 아니면 transcript 끝부분
string ContextBuffer::current_context() const
{
  if (window_.size() > config_.min_context_chars) {
    return window_;
  }
  if (transcript_.empty()) {
    return "";
  }
  if (transcript_.size() <= config_.window_chars) {
    return transcript_;
  }
  return transcript_.substr(transcript_.size() - config_.window_chars);
}

void ContextBuffer::reset()
{
  window_.clear();
  transcript_.clear();
}

const string & ContextBuffer::window() const
{
  return window_;
}

const string & ContextBuffer::transcript() const
{
  return transcript_;
}

}  // namespace transcript_cpp
