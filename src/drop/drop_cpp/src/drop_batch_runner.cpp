#include "drop_cpp/drop_batch_runner.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

using namespace std;


namespace drop_cpp
{

string status_string(FileStatus status)
{
  return status == FileStatus::SUCCESS ? "SUCCESS" : "FAILED";
}

DropBatchRunner::DropBatchRunner(const DropBatchConfig & config, unique_ptr<DropDecisionEngine> engine)
: config_(config), engine_(move(engine))
{
}

vector<string> DropBatchRunner::list_inputs() const
{
  vector<string> names;
  error_code ec;
  if (!filesystem::is_directory(config_.input_dir, ec)) {
    return names;
  }
  const string clip_name = filesystem::path(config_.voice_mail_path).filename().string();
  for (const auto & entry : filesystem::directory_iterator(config_.input_dir, ec)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const filesystem::path path = entry.path();
    if (path.extension() != ".wav") {
      continue;
    }
    const string name = path.filename().string();
    if (name == clip_name) {
      continue;
    }
    names.push_back(name);
  }
  sort(names.begin(), names.end());
  return names;
}

string DropBatchRunner::output_path_for(const string & filename) const
{
  const filesystem::path name(filename);
  return (filesystem::path(config_.output_dir) /
         (name.stem().string() + config_.output_suffix + ".wav")).string();
}

FileResult DropBatchRunner::process_one(const string & filename)
{
  FileResult result;
  result.filename = filename;

  const string input_path = (filesystem::path(config_.input_dir) / filename).string();
  const optional<DropDecision> decision = engine_ ? engine_->process_file(input_path) : nullopt;
  if (!decision) {
    result.error = "decode_failed";
    cout << "[drop_cpp] result: " << filename << " - processing failed" << endl;
    return result;
  }

  result.timestamp_sec = decision->timestamp_sec;
  result.reason = reason_string(decision->reason);
  result.output_file = output_path_for(filename);

  const SpliceResult splice = splicer_.splice_files(
    input_path, config_.voice_mail_path, decision->timestamp_sec, result.output_file);
  if (splice.ok) {
    result.status = FileStatus::SUCCESS;
    cout << "[drop_cpp] saved dropped file to " << result.output_file << endl;
  } else {
    result.status = FileStatus::FAILED;
    result.error = splice.error;
    cerr << "[drop_cpp] error inserting voice mail for " << filename << ": " << splice.error << endl;
  }
  cout << "[drop_cpp] result: " << filename << " - drop at " << fixed << setprecision(2)
       << decision->timestamp_sec << "s (" << result.reason << ")" << endl;
  return result;
}

vector<FileResult> DropBatchRunner::run()
{
  const vector<string> inputs = list_inputs();
  cout << "[drop_cpp] found " << inputs.size() << " files in " << config_.input_dir << endl;

  error_code ec;
  filesystem::create_directories(config_.output_dir, ec);
  if (ec) {
    cerr << "[drop_cpp] cannot create " << config_.output_dir << ": " << ec.message() << endl;
  }

  vector<FileResult> results;
  results.reserve(inputs.size());
  for (const auto & name : inputs) {
    cout << "[drop_cpp] processing " << name << "..." << endl;
    results.push_back(process_one(name));
  }
  return results;
}

string format_results(const vector<FileResult> & results)
{
  ostringstream out;
  out << "Voicemail Drop Timestamps\n";
  out << string(40, '=') << "\n";
  for (const auto & r : results) {
    out << r.filename << ": ";
    if (r.timestamp_sec) {
      out << fixed << setprecision(2) << *r.timestamp_sec;
    } else {
      out << "N/A";
    }
    out << " seconds (" << r.reason << ") -> " << status_string(r.status) << "\n";
  }
  return out.str();
}

bool write_results_file(const string & path, const vector<FileResult> & results, string & error)
{
  const filesystem::path parent = filesystem::path(path).parent_path();
  if (!parent.empty()) {
    error_code ec;
    filesystem::create_directories(parent, ec);
  }
  ofstream out(path);
  if (!out.is_open()) {
    error = "cannot open " + path;
    return false;
  }
  out << format_results(results);
  if (!out.good()) {
    error = "write failed: " + path;
    return false;
  }
  return true;
}

}  // namespace drop_cpp
