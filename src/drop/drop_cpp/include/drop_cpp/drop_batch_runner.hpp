#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "drop_cpp/audio_splicer.hpp"
#include "drop_cpp/drop_decision_engine.hpp"

namespace drop_cpp
{

struct DropBatchConfig
{
  std::string input_dir = "demo_files";
  std::string voice_mail_path = "voice_mail.wav";
  std::string output_dir = "output";
  std::string output_suffix = "_dropped";
};

enum class FileStatus
{
  SUCCESS,
  FAILED
};

std::string status_string(FileStatus status);

struct FileResult
{
  std::string filename;
  std::optional<double> timestamp_sec;
  std::string reason = "none";
  FileStatus status = FileStatus::FAILED;
  std::string output_file;
  std::string error;
};

/// 디렉터리의 모든 .wav에 엔진을 돌리고 각 파일에 음성 메시지 클립을 삽입한다.
/// 파일 하나가 실패해도 batch는 멈추지 않는다.
class DropBatchRunner
{
public:
  DropBatchRunner(const DropBatchConfig & config, std::unique_ptr<DropDecisionEngine> engine);

  /// 정렬된 *.wav 이름, 음성 메시지 클립 자체는 제외
  std::vector<std::string> list_inputs() const;
  FileResult process_one(const std::string & filename);
  std::vector<FileResult> run();

  std::string output_path_for(const std::string & filename) const;

private:
  DropBatchConfig config_;
  std::unique_ptr<DropDecisionEngine> engine_;
  AudioSplicer splicer_;
};

/// 제목 아래 "<file>: <ts> seconds (<reason>) -> <status>" 줄들
std::string format_results(const std::vector<FileResult> & results);
bool write_results_file(
  const std::string & path, const std::vector<FileResult> & results, std::string & error);

}  // namespace drop_cpp
