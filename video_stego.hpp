#ifndef VIDEO_STEGO_HPP
#define VIDEO_STEGO_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "stega_codec.hpp"

// A decoded video as one cover: equally sized frames, each flattened to RGB
// and stacked in frame order.
namespace vdstego {

    struct FramePos {
        int frame;
        int x;
        int y;
    };

    bool stackFrames(const std::vector<cv::Mat>& frames, std::vector<uint8_t>& outFlat, int& rows, int& cols);

    bool unstackFrames(const std::vector<uint8_t>& flat, size_t frameCount, int rows, int cols,
                       std::vector<cv::Mat>& outFrames);

    uint64_t capacityBitsForFrames(const std::vector<cv::Mat>& frames, int lsbBits, const FramePos* start = nullptr);

    stega::Error encodeFrames(const std::vector<cv::Mat>& frames,
                              const std::vector<uint8_t>& payload,
                              const std::string& filename,
                              int lsbBits,
                              const std::string& key,
                              const stega::EncodeOptions& options,
                              const FramePos* start,
                              std::vector<cv::Mat>& outFrames,
                              stega::HeaderMeta& outHeader);

    stega::Error decodeFrames(const std::vector<cv::Mat>& frames,
                              int lsbBits,
                              const std::string& key,
                              const stega::DecodeOptions& options,
                              stega::DecodeResult& out);
}

#endif
