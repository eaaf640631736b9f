#include "stt/whisper_stt.hpp"

#include <whisper.h>
#include <stdexcept>
#include <utility>

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, std::string language) : language_(std::move(language)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts 16-bit samples to floats in [-1, 1)
std::vector<float> WhisperSTT::toFloat(const std::vector<uint8_t>& pcm) {
    std::vector<float> out(pcm.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const int16_t s = (int16_t)(uint16_t)(pcm[2 * i] | (pcm[2 * i + 1] << 8));
        out[i] = (float)s / 32768.0f;
    }
    return out;
}

std::string WhisperSTT::transcribePcm16(const std::vector<uint8_t>& pcm, int threads) {
    return transcribe(toFloat(pcm), threads);
}

// Converts pcm16kMono into text (std::string)
std::string WhisperSTT::transcribe(const std::vector<float>& pcm16kMono, int threads) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = threads;
    params.language = language_.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    // A voice command is a single short segment
    params.single_segment = true;
    params.no_context = true;
    params.no_speech_thold = 0.6f;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);

    // Segments come back with a leading space
    const size_t first = out.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : out.substr(first);
}
