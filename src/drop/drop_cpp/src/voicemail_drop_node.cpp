#include "drop_cpp/voicemail_drop_node.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

#include "detect_cpp/voice_classifier.hpp"
#include "greeting_cpp/greeting_oracle.hpp"
#include "transcript_cpp/simulated_transcriber.hpp"

using namespace std;


namespace drop_cpp
{

VoicemailDropNode::VoicemailDropNode()
: Node("voicemail_drop_node"), oracle_timeout_sec_(15), oracle_rate_limit_sec_(2.0),
  oracle_cache_ttl_sec_(60.0), vad_threshold_(0.5), chunk_duration_sec_(0.1),
  silence_trigger_sec_(0.6)
{
  declare_and_get_parameters();
}

void VoicemailDropNode::declare_and_get_parameters()
{
  declare_parameter<string>("input_dir", "demo_files");
  declare_parameter<string>("voice_mail_path", "voice_mail.wav");
  declare_parameter<string>("output_dir", "output");
  declare_parameter<string>("results_file", "");

  declare_parameter<string>("github_token", "");
  declare_parameter<string>("oracle_url", "https://models.github.ai/inference/chat/completions");
  declare_parameter<string>("oracle_model", "openai/gpt-4.1");
  declare_parameter<int>("oracle_timeout_sec", 15);
  declare_parameter<double>("oracle_rate_limit_sec", 2.0);
  declare_parameter<double>("oracle_cache_ttl_sec", 60.0);

  declare_parameter<string>("vad_model_path", "");
  declare_parameter<double>("vad_threshold", 0.5);
  declare_parameter<double>("chunk_duration_sec", 0.1);
  declare_parameter<double>("silence_trigger_sec", 0.6);

  input_dir_ = get_parameter("input_dir").as_string();
  voice_mail_path_ = get_parameter("voice_mail_path").as_string();
  output_dir_ = get_parameter("output_dir").as_string();
  results_file_ = get_parameter("results_file").as_string();

  github_token_ = get_parameter("github_token").as_string();
  oracle_url_ = get_parameter("oracle_url").as_string();
  oracle_model_ = get_parameter("oracle_model").as_string();
  oracle_timeout_sec_ = get_parameter("oracle_timeout_sec").as_int();
  oracle_rate_limit_sec_ = get_parameter("oracle_rate_limit_sec").as_double();
  oracle_cache_ttl_sec_ = get_parameter("oracle_cache_ttl_sec").as_double();

  vad_model_path_ = get_parameter("vad_model_path").as_string();
  vad_threshold_ = get_parameter("vad_threshold").as_double();
  chunk_duration_sec_ = get_parameter("chunk_duration_sec").as_double();
  silence_trigger_sec_ = get_parameter("silence_trigger_sec").as_double();

  // 파라미터가 없으면 환경 변수 사용
  if (github_token_.empty()) {
    const char * token = getenv("GITHUB_TOKEN");
    if (token) {
      github_token_ = token;
    }
  }
  if (results_file_.empty()) {
    results_file_ = (filesystem::path(output_dir_) / "results.txt").string();
  }
}

int VoicemailDropNode::run()
{
  RCLCPP_INFO(get_logger(), "==================================================");
  RCLCPP_INFO(get_logger(), "VOICEMAIL COMPLIANCE DETECTION");
  RCLCPP_INFO(get_logger(), "==================================================");

  error_code ec;
  if (!filesystem::is_directory(input_dir_, ec)) {
    RCLCPP_ERROR(
      get_logger(), "'%s' not found. Create the folder and add .wav files.", input_dir_.c_str());
    return 1;
  }
  if (!filesystem::is_regular_file(voice_mail_path_, ec)) {
    RCLCPP_WARN(
      get_logger(),
      "'%s' not found. Files will still be analysed but no dropped files can be written.",
      voice_mail_path_.c_str());
  }

  if (chunk_duration_sec_ <= 0.0) {
    RCLCPP_ERROR(get_logger(), "chunk_duration_sec must be positive");
    return 1;
  }

  detect_cpp::VadSelection vad_selection;
  vad_selection.silero_model_path = vad_model_path_;
  vad_selection.silero_threshold = static_cast<float>(vad_threshold_);
  string vad_error;
  auto classifier = detect_cpp::make_voice_classifier(vad_selection, vad_error);
  if (!classifier) {
    RCLCPP_ERROR(get_logger(), "voice classifier init failed: %s", vad_error.c_str());
    return 1;
  }

  greeting_cpp::OracleConfig oracle_cfg;
  oracle_cfg.api_key = github_token_;
  oracle_cfg.url = oracle_url_;
  oracle_cfg.model = oracle_model_;
  oracle_cfg.timeout_sec = oracle_timeout_sec_;
  oracle_cfg.rate_limit_sec = oracle_rate_limit_sec_;
  oracle_cfg.cache_ttl_sec = oracle_cache_ttl_sec_;
  auto oracle = greeting_cpp::make_greeting_oracle(oracle_cfg);

  RCLCPP_INFO(
    get_logger(), "vad=%s oracle=%s", classifier->name().c_str(), oracle->name().c_str());

  DropEngineConfig engine_cfg;
  engine_cfg.chunk_duration_sec = chunk_duration_sec_;
  engine_cfg.silence_trigger_sec = silence_trigger_sec_;
  auto engine = make_unique<DropDecisionEngine>(
    engine_cfg, oracle, make_unique<transcript_cpp::SimulatedTranscriber>(), classifier);

  DropBatchConfig batch_cfg;
  batch_cfg.input_dir = input_dir_;
  batch_cfg.voice_mail_path = voice_mail_path_;
  batch_cfg.output_dir = output_dir_;
  DropBatchRunner runner(batch_cfg, move(engine));

  const vector<FileResult> results = runner.run();
  log_summary(results);

  string write_error;
  if (!write_results_file(results_file_, results, write_error)) {
    RCLCPP_ERROR(get_logger(), "failed to save results: %s", write_error.c_str());
    return 1;
  }
  RCLCPP_INFO(get_logger(), "results saved to %s", results_file_.c_str());
  return 0;
}

void VoicemailDropNode::log_summary(const vector<FileResult> & results)
{
  RCLCPP_INFO(get_logger(), "FINAL RESULTS");
  RCLCPP_INFO(get_logger(), "%-25s %-12s %-30s %-10s", "File", "Drop Time", "Trigger", "Status");
  for (const auto & r : results) {
    char ts[32];
    if (r.timestamp_sec) {
      snprintf(ts, sizeof(ts), "%.2fs", *r.timestamp_sec);
    } else {
      snprintf(ts, sizeof(ts), "N/A");
    }
    RCLCPP_INFO(
      get_logger(), "%-25s %-12s %-30s %-10s",
      r.filename.c_str(), ts, r.reason.c_str(), status_string(r.status).c_str());
  }
}

}  // namespace drop_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<drop_cpp::VoicemailDropNode>();
  const int rc = node->run();
  rclcpp::shutdown();
  return rc;
}
