#include "speech_segmenter_cpp/classifier_factory.hpp"

#include "speech_segmenter_cpp/energy_classifier.hpp"
#include "speech_segmenter_cpp/fvad_classifier.hpp"
#include "speech_segmenter_cpp/silero_classifier.hpp"

using namespace std;


namespace speech_segmenter_cpp
{

unique_ptr<ActivityClassifier> make_classifier(
  const ClassifierConfig & classifier_config,
  const SegmenterConfig & segmenter_config)
{
  require_valid_config(segmenter_config);
  const size_t samples = frame_samples(segmenter_config);

  if (classifier_config.backend == "webrtc") {
    auto vad = make_unique<FvadClassifier>();
    if (!vad->initialize(segmenter_config.aggressiveness, segmenter_config.sample_rate, samples)) {
      throw ConfigurationError(vad->last_error());
    }
    return vad;
  }
  if (classifier_config.backend == "silero") {
    auto vad = make_unique<SileroClassifier>();
    if (!vad->initialize(
        segmenter_config.aggressiveness, classifier_config.model_path,
        segmenter_config.sample_rate, samples, classifier_config.threshold))
    {
      throw ConfigurationError(vad->last_error());
    }
    return vad;
  }
  if (classifier_config.backend == "energy") {
    return make_unique<EnergyClassifier>(segmenter_config.aggressiveness);
  }

  throw ConfigurationError("unknown classifier backend: " + classifier_config.backend);
}

}  // namespace speech_segmenter_cpp
