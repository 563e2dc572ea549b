#pragma once

#include "audio/audio_segment.hpp"
#include <cstdint>
#include <vector>

namespace voicebridge {
namespace audio {
namespace wav {

// Wraps raw little-endian PCM bytes into an in-memory WAV file.
inline std::vector<uint8_t> encode(const std::vector<uint8_t>& pcm, const AudioFormat& format) {
    uint32_t byte_rate = format.sampleRate * format.channels * format.bitsPerSample / 8;
    uint16_t block_align = static_cast<uint16_t>(format.channels * format.bitsPerSample / 8);
    uint32_t data_size = static_cast<uint32_t>(pcm.size());
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);
    auto tag = [&out](const char* t) { out.insert(out.end(), t, t + 4); };
    auto w16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xff));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto w32 = [&out](uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
        }
    };

    tag("RIFF");
    w32(file_size);
    tag("WAVE");
    tag("fmt ");
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(format.channels);
    w32(format.sampleRate);
    w32(byte_rate);
    w16(block_align);
    w16(format.bitsPerSample);
    tag("data");
    w32(data_size);
    out.insert(out.end(), pcm.begin(), pcm.end());

    return out;
}

} // namespace wav
} // namespace audio
} // namespace voicebridge
