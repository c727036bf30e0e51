#include "audio_stego.hpp"

#include <iostream>

namespace audstego {

    static const int MAX_SAMPLE_WIDTH = 4;

    stega::Error checkFormat(const std::vector<uint8_t>& pcm, const PcmFormat& fmt)
    {
        if (fmt.channels < 1) {
            std::cerr << "[audio] Channel count must be positive, got " << fmt.channels << "\n";
            return stega::Error::UnsupportedAudio;
        }
        if (fmt.sampleWidth < 1 || fmt.sampleWidth > MAX_SAMPLE_WIDTH) {
            std::cerr << "[audio] Unsupported sample width: " << fmt.sampleWidth << " bytes\n";
            return stega::Error::UnsupportedAudio;
        }
        const size_t frameBytes = static_cast<size_t>(fmt.channels) * fmt.sampleWidth;
        if (pcm.empty() || pcm.size() % frameBytes != 0) {
            std::cerr << "[audio] " << pcm.size() << " bytes is not a whole number of "
                      << frameBytes << "-byte frames\n";
            return stega::Error::UnsupportedAudio;
        }
        return stega::Error::Ok;
    }

    uint64_t frameCount(const std::vector<uint8_t>& pcm, const PcmFormat& fmt)
    {
        if (fmt.channels < 1 || fmt.sampleWidth < 1) return 0;
        return pcm.size() / (static_cast<uint64_t>(fmt.channels) * fmt.sampleWidth);
    }

    stega::Error getAudioInfo(const std::vector<uint8_t>& pcm, const PcmFormat& fmt, AudioInfo& out)
    {
        stega::Error err = checkFormat(pcm, fmt);
        if (err != stega::Error::Ok) return err;

        out.channels = fmt.channels;
        out.sampleRate = fmt.sampleRate;
        out.sampleWidthBits = fmt.sampleWidth * 8;
        out.frames = frameCount(pcm, fmt);
        out.duration = fmt.sampleRate ? static_cast<double>(out.frames) / fmt.sampleRate : 0.0;
        return stega::Error::Ok;
    }

    uint64_t capacityBitsForAudio(const std::vector<uint8_t>& pcm, const PcmFormat& fmt, int lsbBits,
                                  const uint64_t* startSample)
    {
        if (checkFormat(pcm, fmt) != stega::Error::Ok) return 0;

        uint64_t total = stega::capacityBits(pcm.size(), lsbBits);
        if (!startSample) {
            return total;
        }
        uint64_t startBit = *startSample * fmt.channels * fmt.sampleWidth * static_cast<uint64_t>(lsbBits);
        return *startSample >= frameCount(pcm, fmt) || startBit >= total ? 0 : total - startBit;
    }

    stega::Error encodeAudio(const std::vector<uint8_t>& pcm,
                             const PcmFormat& fmt,
                             const std::vector<uint8_t>& payload,
                             const std::string& filename,
                             int lsbBits,
                             const std::string& key,
                             const stega::EncodeOptions& options,
                             const uint64_t* startSample,
                             std::vector<uint8_t>& outPcm,
                             stega::HeaderMeta& outHeader)
    {
        stega::Error err = checkFormat(pcm, fmt);
        if (err != stega::Error::Ok) return err;

        stega::EncodeOptions opts = options;
        if (startSample) {
            if (*startSample >= frameCount(pcm, fmt)) {
                std::cerr << "[audio] Start sample " << *startSample << " is past the last of "
                          << frameCount(pcm, fmt) << " samples\n";
                return stega::Error::InvalidArgument;
            }
            if (lsbBits < stega::MIN_LSB_BITS || lsbBits > stega::MAX_LSB_BITS) {
                return stega::Error::InvalidLsbBits;
            }
            uint64_t startByte = *startSample * fmt.channels * fmt.sampleWidth;
            opts.hasStartBit = true;
            opts.startBit = startByte * lsbBits;
        }

        std::vector<uint8_t> stego = pcm;
        err = stega::encode(stego, payload, filename, lsbBits, key, opts, outHeader);
        if (err != stega::Error::Ok) {
            std::cerr << "[audio] Embedding failed: " << stega::errorString(err) << "\n";
            return err;
        }
        outPcm.swap(stego);
        return stega::Error::Ok;
    }

    stega::Error decodeAudio(const std::vector<uint8_t>& pcm,
                             const PcmFormat& fmt,
                             int lsbBits,
                             const std::string& key,
                             const stega::DecodeOptions& options,
                             stega::DecodeResult& out)
    {
        stega::Error err = checkFormat(pcm, fmt);
        if (err != stega::Error::Ok) return err;
        return stega::decode(pcm, lsbBits, key, options, out);
    }

}
