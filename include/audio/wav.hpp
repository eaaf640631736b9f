#ifndef WAV_HPP
#define WAV_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace wav {

struct WavData {
    int sampleRate = 0;
    int sampleWidth = 0;
    int channels = 0;
    std::vector<uint8_t> pcm;
};

// Wraps raw PCM in a canonical 44-byte RIFF/WAVE header
std::vector<uint8_t> encode(const std::vector<uint8_t>& pcm, int sampleRate, int sampleWidth, int channels);

// Parses an uncompressed PCM WAV file. Throws std::runtime_error on malformed input.
WavData decode(const std::vector<uint8_t>& bytes);

WavData readFile(const std::string& path);

} // namespace wav

#endif
