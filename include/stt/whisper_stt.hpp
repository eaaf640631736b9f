#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include <cstdint>
#include <string>
#include <vector>

struct whisper_context;

// Local speech-to-text, used instead of the remote endpoint when configured
class WhisperSTT {
public:
    WhisperSTT(const std::string& modelPath, std::string language = "en");
    ~WhisperSTT();

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<float>& pcm16kMono, int threads = 4);

    // 16-bit little-endian PCM at 16 kHz, as produced by the recorder
    std::string transcribePcm16(const std::vector<uint8_t>& pcm, int threads = 4);

    static std::vector<float> toFloat(const std::vector<uint8_t>& pcm);

private:
    whisper_context* context_ = nullptr;
    std::string language_;
};

#endif
