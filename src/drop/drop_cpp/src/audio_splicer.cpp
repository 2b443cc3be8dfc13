#include "drop_cpp/audio_splicer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;


namespace drop_cpp
{

AudioBuffer AudioSplicer::resample_linear(const AudioBuffer & clip, int target_rate) const
{
  if (clip.sample_rate == target_rate || clip.sample_rate <= 0 || target_rate <= 0) {
    return clip;
  }

  AudioBuffer out;
  out.sample_rate = target_rate;
  out.channels = clip.channels;
  out.format = clip.format;

  const size_t in_frames = clip.frames();
  const size_t out_frames = static_cast<size_t>(ceil(
      static_cast<double>(in_frames) *
      (static_cast<double>(target_rate) / static_cast<double>(clip.sample_rate))));
  const size_t ch_count = static_cast<size_t>(clip.channels);
  out.samples.assign(out_frames * ch_count, 0.0F);
  if (in_frames == 0 || out_frames == 0) {
    return out;
  }

  // 두 격자 모두 [0, 1]에 걸친다. 첫 샘플과 끝 샘플이 서로 대응한다.
  const double step = out_frames > 1 ?
    static_cast<double>(in_frames - 1) / static_cast<double>(out_frames - 1) : 0.0;
  for (size_t i = 0; i < out_frames; ++i) {
    const double pos = static_cast<double>(i) * step;
    size_t j0 = static_cast<size_t>(floor(pos));
    if (j0 >= in_frames - 1) {
      j0 = in_frames - 1;
    }
    const size_t j1 = min(j0 + 1, in_frames - 1);
    const double frac = pos - static_cast<double>(j0);
    for (size_t ch = 0; ch < ch_count; ++ch) {
      const double a = clip.samples[j0 * ch_count + ch];
      const double b = clip.samples[j1 * ch_count + ch];
      out.samples[i * ch_count + ch] = static_cast<float>(a + (b - a) * frac);
    }
  }
  return out;
}

bool AudioSplicer::match_channels(
  const AudioBuffer & in, int target_channels, AudioBuffer & out, string & error) const
{
  if (target_channels <= 0 || in.channels <= 0) {
    error = "invalid channel count";
    return false;
  }

  out.sample_rate = in.sample_rate;
  out.format = in.format;
  out.channels = target_channels;

  if (in.channels == target_channels) {
    out.samples = in.samples;
    return true;
  }
  if (target_channels == 1) {
    out.samples = in.to_mono();
    return true;
  }
  if (in.channels == 1) {
    const size_t n = in.frames();
    const size_t tc = static_cast<size_t>(target_channels);
    out.samples.assign(n * tc, 0.0F);
    for (size_t i = 0; i < n; ++i) {
      for (size_t ch = 0; ch < tc; ++ch) {
        out.samples[i * tc + ch] = in.samples[i];
      }
    }
    return true;
  }

  error = "cannot map " + to_string(in.channels) + " channels onto " +
    to_string(target_channels);
  return false;
}

size_t AudioSplicer::insertion_frame(double drop_time, int sample_rate, size_t frames) const
{
  if (!(drop_time > 0.0) || sample_rate <= 0) {
    return 0;
  }
  const double index = round(drop_time * static_cast<double>(sample_rate));
  if (index >= static_cast<double>(frames)) {
    return frames;
  }
  return static_cast<size_t>(index);
}

bool AudioSplicer::insert(
  const AudioBuffer & original, const AudioBuffer & clip, double drop_time,
  AudioBuffer & out, SpliceResult & result) const
{
  if (original.sample_rate <= 0 || original.channels <= 0) {
    result.error = "original has no valid format";
    return false;
  }
  if (clip.sample_rate <= 0 || clip.channels <= 0) {
    result.error = "clip has no valid format";
    return false;
  }

  AudioBuffer resampled = resample_linear(clip, original.sample_rate);
  if (clip.sample_rate != original.sample_rate) {
    cout << "[drop_cpp] resampled clip " << clip.sample_rate << "Hz -> "
         << original.sample_rate << "Hz" << endl;
  }

  AudioBuffer matched;
  string error;
  if (!match_channels(resampled, original.channels, matched, error)) {
    result.error = error;
    return false;
  }

  const size_t ch = static_cast<size_t>(original.channels);
  const size_t index = insertion_frame(drop_time, original.sample_rate, original.frames());
  const auto split = original.samples.begin() + static_cast<ptrdiff_t>(index * ch);

  out.sample_rate = original.sample_rate;
  out.channels = original.channels;
  out.format = original.format;
  out.samples.clear();
  out.samples.reserve(original.samples.size() + matched.samples.size());
  out.samples.insert(out.samples.end(), original.samples.begin(), split);
  out.samples.insert(out.samples.end(), matched.samples.begin(), matched.samples.end());
  out.samples.insert(out.samples.end(), split, original.samples.end());

  result.original_frames = original.frames();
  result.clip_frames = matched.frames();
  result.output_frames = out.frames();
  result.insert_frame = index;
  return true;
}

SpliceResult AudioSplicer::splice_files(
  const string & original_path, const string & clip_path,
  double drop_time, const string & output_path) const
{
  SpliceResult result;
  result.output_path = output_path;

  AudioBuffer original;
  const AudioIoResult orig_io = read_audio(original_path, original);
  if (!orig_io.ok) {
    result.error = "original: " + orig_io.error;
    return result;
  }
  AudioBuffer clip;
  const AudioIoResult clip_io = read_audio(clip_path, clip);
  if (!clip_io.ok) {
    result.error = "clip: " + clip_io.error;
    return result;
  }

  AudioBuffer spliced;
  if (!insert(original, clip, drop_time, spliced, result)) {
    return result;
  }

  const AudioIoResult write_io = write_audio(output_path, spliced);
  if (!write_io.ok) {
    result.error = write_io.error;
    return result;
  }
  result.ok = true;
  return result;
}

}  // namespace drop_cpp
