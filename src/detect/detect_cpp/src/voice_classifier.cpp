#include "detect_cpp/voice_classifier.hpp"

#include "detect_cpp/energy_vad.hpp"
#include "detect_cpp/silero_vad.hpp"

using namespace std;


namespace detect_cpp
{

shared_ptr<VoiceClassifier> make_voice_classifier(const VadSelection & selection, string & error)
{
  if (selection.silero_model_path.empty()) {
    return make_shared<EnergyVad>();
  }
  auto silero = make_shared<SileroVad>();
  if (!silero->initialize(selection.silero_threshold, selection.silero_model_path)) {
    error = silero->last_error();
    return nullptr;
  }
  return silero;
}

}  // namespace detect_cpp
