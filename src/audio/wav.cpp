#include "audio/wav.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace wav {

namespace {

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)((v >> 8) & 0xFF));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t get16(const std::vector<uint8_t>& b, size_t pos) {
    return (uint16_t)(b[pos] | (b[pos + 1] << 8));
}

uint32_t get32(const std::vector<uint8_t>& b, size_t pos) {
    return (uint32_t)b[pos] | ((uint32_t)b[pos + 1] << 8) |
           ((uint32_t)b[pos + 2] << 16) | ((uint32_t)b[pos + 3] << 24);
}

bool tagAt(const std::vector<uint8_t>& b, size_t pos, const char* tag) {
    return b.size() >= pos + 4 && b[pos] == (uint8_t)tag[0] && b[pos + 1] == (uint8_t)tag[1] &&
           b[pos + 2] == (uint8_t)tag[2] && b[pos + 3] == (uint8_t)tag[3];
}

} // namespace

std::vector<uint8_t> encode(const std::vector<uint8_t>& pcm, int sampleRate, int sampleWidth, int channels) {
    const uint32_t dataSize = (uint32_t)pcm.size();
    const uint16_t blockAlign = (uint16_t)(sampleWidth * channels);

    std::vector<uint8_t> out;
    out.reserve(44 + pcm.size());

    putTag(out, "RIFF");
    put32(out, 36 + dataSize);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    put32(out, 16);
    put16(out, 1); // PCM
    put16(out, (uint16_t)channels);
    put32(out, (uint32_t)sampleRate);
    put32(out, (uint32_t)sampleRate * blockAlign);
    put16(out, blockAlign);
    put16(out, (uint16_t)(8 * sampleWidth));

    putTag(out, "data");
    put32(out, dataSize);
    out.insert(out.end(), pcm.begin(), pcm.end());
    return out;
}

WavData decode(const std::vector<uint8_t>& bytes) {
    if (!tagAt(bytes, 0, "RIFF") || !tagAt(bytes, 8, "WAVE")) {
        throw std::runtime_error("wav: not a RIFF/WAVE file");
    }

    WavData wav;
    bool haveFormat = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint32_t size = get32(bytes, pos + 4);
        const size_t body = pos + 8;
        if (body + size > bytes.size()) throw std::runtime_error("wav: truncated chunk");

        if (tagAt(bytes, pos, "fmt ")) {
            if (size < 16) throw std::runtime_error("wav: short fmt chunk");
            if (get16(bytes, body) != 1) throw std::runtime_error("wav: only PCM is supported");
            wav.channels = get16(bytes, body + 2);
            wav.sampleRate = (int)get32(bytes, body + 4);
            wav.sampleWidth = get16(bytes, body + 14) / 8;
            haveFormat = true;
        } else if (tagAt(bytes, pos, "data")) {
            if (!haveFormat) throw std::runtime_error("wav: data before fmt chunk");
            wav.pcm.assign(bytes.begin() + (std::ptrdiff_t)body, bytes.begin() + (std::ptrdiff_t)(body + size));
            return wav;
        }

        // Chunks are word aligned
        pos = body + size + (size & 1);
    }

    throw std::runtime_error("wav: no data chunk");
}

WavData readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("wav: cannot open " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace wav
