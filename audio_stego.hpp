#ifndef AUDIO_STEGO_HPP
#define AUDIO_STEGO_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "stega_codec.hpp"

// Uncompressed PCM as a cover: the interleaved sample bytes exactly as they
// sit in a WAV data chunk. Every byte carries LSBs, whatever the sample width.
namespace audstego {

    struct PcmFormat {
        int channels = 1;
        int sampleWidth = 2;        // bytes per sample, 1..4
        uint32_t sampleRate = 44100;
    };

    struct AudioInfo {
        int channels = 0;
        uint32_t sampleRate = 0;
        int sampleWidthBits = 0;
        uint64_t frames = 0;
        double duration = 0.0;      // seconds, 0 when the rate is unknown
    };

    // Channel count, width and buffer length must agree
    stega::Error checkFormat(const std::vector<uint8_t>& pcm, const PcmFormat& fmt);

    uint64_t frameCount(const std::vector<uint8_t>& pcm, const PcmFormat& fmt);

    stega::Error getAudioInfo(const std::vector<uint8_t>& pcm, const PcmFormat& fmt, AudioInfo& out);

    // Bits from startSample (or the buffer start) to the end
    uint64_t capacityBitsForAudio(const std::vector<uint8_t>& pcm, const PcmFormat& fmt, int lsbBits,
                                  const uint64_t* startSample = nullptr);

    // startSample counts frames: sample i of every channel sits at byte
    // i * channels * sampleWidth
    stega::Error encodeAudio(const std::vector<uint8_t>& pcm,
                             const PcmFormat& fmt,
                             const std::vector<uint8_t>& payload,
                             const std::string& filename,
                             int lsbBits,
                             const std::string& key,
                             const stega::EncodeOptions& options,
                             const uint64_t* startSample,
                             std::vector<uint8_t>& outPcm,
                             stega::HeaderMeta& outHeader);

    stega::Error decodeAudio(const std::vector<uint8_t>& pcm,
                             const PcmFormat& fmt,
                             int lsbBits,
                             const std::string& key,
                             const stega::DecodeOptions& options,
                             stega::DecodeResult& out);
}

#endif
