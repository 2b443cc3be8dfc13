#include "drop_cpp/audio_buffer.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

using namespace std;


namespace drop_cpp
{

vector<float> AudioBuffer::to_mono() const
{
  if (channels <= 1) {
    return samples;
  }
  const size_t n = frames();
  vector<float> mono(n, 0.0F);
  for (size_t i = 0; i < n; ++i) {
    float acc = 0.0F;
    for (int ch = 0; ch < channels; ++ch) {
      acc += samples[i * static_cast<size_t>(channels) + static_cast<size_t>(ch)];
    }
    mono[i] = acc / static_cast<float>(channels);
  }
  return mono;
}

AudioIoResult read_audio(const string & path, AudioBuffer & out)
{
  AudioIoResult result;
  if (!filesystem::is_regular_file(path)) {
    result.error = "audio file not found: " + path;
    return result;
  }

  SF_INFO sf_info{};
  SNDFILE * snd = sf_open(path.c_str(), SFM_READ, &sf_info);
  if (snd == nullptr) {
    result.error = string("libsndfile open failed: ") + sf_strerror(nullptr);
    return result;
  }
  if (sf_info.channels <= 0 || sf_info.samplerate <= 0) {
    sf_close(snd);
    result.error = "invalid channel count or sample rate";
    return result;
  }

  vector<float> interleaved(static_cast<size_t>(sf_info.frames) * static_cast<size_t>(sf_info.channels), 0.0F);
  const sf_count_t read_frames = sf_info.frames > 0 ?
    sf_readf_float(snd, interleaved.data(), sf_info.frames) : 0;
  sf_close(snd);

  if (read_frames < 0 || (sf_info.frames > 0 && read_frames == 0)) {
    result.error = "failed to read audio samples (libsndfile)";
    return result;
  }
  interleaved.resize(static_cast<size_t>(read_frames) * static_cast<size_t>(sf_info.channels));

  out.samples = move(interleaved);
  out.sample_rate = sf_info.samplerate;
  out.channels = sf_info.channels;
  out.format = sf_info.format;
  result.ok = true;
  return result;
}

float normalize_peak(vector<float> & samples)
{
  float peak = 0.0F;
  for (const float s : samples) {
    peak = max(peak, fabs(s));
  }
  if (peak <= 1.0F) {
    return 1.0F;
  }
  const float gain = 1.0F / peak;
  for (float & s : samples) {
    s *= gain;
  }
  return gain;
}

AudioIoResult write_audio(const string & path, const AudioBuffer & audio)
{
  AudioIoResult result;
  if (audio.sample_rate <= 0 || audio.channels <= 0) {
    result.error = "invalid channel count or sample rate";
    return result;
  }

  const filesystem::path parent = filesystem::path(path).parent_path();
  if (!parent.empty()) {
    error_code ec;
    filesystem::create_directories(parent, ec);
    if (ec) {
      result.error = "cannot create output directory: " + ec.message();
      return result;
    }
  }

  vector<float> samples = audio.samples;
  normalize_peak(samples);

  SF_INFO sf_info{};
  sf_info.samplerate = audio.sample_rate;
  sf_info.channels = audio.channels;
  sf_info.format = audio.format != 0 ? audio.format : (SF_FORMAT_WAV | SF_FORMAT_PCM_16);
  if (!sf_format_check(&sf_info)) {
    sf_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;
  }

  SNDFILE * snd = sf_open(path.c_str(), SFM_WRITE, &sf_info);
  if (snd == nullptr) {
    result.error = string("libsndfile open for write failed: ") + sf_strerror(nullptr);
    return result;
  }
  const sf_count_t frames = static_cast<sf_count_t>(samples.size() / static_cast<size_t>(audio.channels));
  const sf_count_t written = frames > 0 ? sf_writef_float(snd, samples.data(), frames) : 0;
  sf_close(snd);

  if (written != frames) {
    result.error = "short write to " + path;
    return result;
  }
  result.ok = true;
  return result;
}

}  // namespace drop_cpp
