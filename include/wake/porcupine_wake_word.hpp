#ifndef PORCUPINE_WAKE_WORD_HPP
#define PORCUPINE_WAKE_WORD_HPP

#include "wake/wake_word.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct pv_porcupine;

class PorcupineWakeWord : public WakeWordDetector {
public:
    struct Config {
        std::string accessKey;
        std::string modelPath;
        std::vector<std::string> keywordPaths;
        std::vector<float> sensitivities; // one per keyword, 0.5 when missing
    };

    explicit PorcupineWakeWord(const Config& config);
    ~PorcupineWakeWord() override;

    PorcupineWakeWord(const PorcupineWakeWord&) = delete;
    PorcupineWakeWord& operator=(const PorcupineWakeWord&) = delete;

    int frameLength() const override;
    int sampleRate() const override;
    int process(const int16_t* frame) override;

private:
    pv_porcupine* porcupine_ = nullptr;
};

#endif
