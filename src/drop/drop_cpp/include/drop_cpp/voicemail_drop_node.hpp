#pragma once

#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "drop_cpp/drop_batch_runner.hpp"

namespace drop_cpp
{

/// 한 번 실행하는 batch 노드. 파라미터를 읽어 입력 디렉터리를 처리하고
/// 결과 파일을 쓴 뒤 요약 표를 로그로 남긴다.
class VoicemailDropNode : public rclcpp::Node
{
public:
  VoicemailDropNode();

  /// 프로세스 종료 코드 반환
  int run();

private:
  void declare_and_get_parameters();
  void log_summary(const std::vector<FileResult> & results);

  std::string input_dir_;
  std::string voice_mail_path_;
  std::string output_dir_;
  std::string results_file_;

  std::string github_token_;
  std::string oracle_url_;
  std::string oracle_model_;
  long oracle_timeout_sec_;
  double oracle_rate_limit_sec_;
  double oracle_cache_ttl_sec_;

  std::string vad_model_path_;
  double vad_threshold_;
  double chunk_duration_sec_;
  double silence_trigger_sec_;
};

}  // namespace drop_cpp
