#include "stt/whisper_stt.hpp"

#include <whisper.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

// whisper hands its abort callback a mutable pointer; the token stays const.
struct AbortCheck {
    const CancellationToken* token = nullptr;
};

bool abort_requested(void* user) {
    const auto* check = static_cast<const AbortCheck*>(user);
    return check->token && check->token->cancelled();
}

} // namespace

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts pcm16kMono into text, aborting the decode once the token is cancelled
std::string WhisperSTT::transcribe(const std::vector<float>& pcm16kMono, const CancellationToken* token) {
    if (pcm16kMono.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    if (token && token->cancelled()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    AbortCheck check{token};
    params.abort_callback = &abort_requested;
    params.abort_callback_user_data = &check;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (token && token->cancelled()) return {};
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return out;
}
