#include "video_stego.hpp"
#include "image_stego.hpp"

#include <iostream>

namespace vdstego {

    static const int RGB_CHANNELS = 3;

    bool stackFrames(const std::vector<cv::Mat>& frames, std::vector<uint8_t>& outFlat, int& rows, int& cols)
    {
        if (frames.empty()) {
            std::cerr << "[video] No frames\n";
            return false;
        }

        outFlat.clear();
        rows = frames[0].rows;
        cols = frames[0].cols;

        for (size_t i = 0; i < frames.size(); i++) {
            if (frames[i].rows != rows || frames[i].cols != cols) {
                std::cerr << "[video] Frame " << i << " is " << frames[i].cols << "x" << frames[i].rows
                          << ", expected " << cols << "x" << rows << "\n";
                return false;
            }

            std::vector<uint8_t> flat;
            int r = 0, c = 0;
            if (!imgstego::flattenImage(frames[i], flat, r, c)) {
                return false;
            }
            outFlat.insert(outFlat.end(), flat.begin(), flat.end());
        }
        return true;
    }

    bool unstackFrames(const std::vector<uint8_t>& flat, size_t frameCount, int rows, int cols,
                       std::vector<cv::Mat>& outFrames)
    {
        const size_t frameBytes = static_cast<size_t>(rows) * cols * RGB_CHANNELS;
        if (frameCount == 0 || flat.size() != frameBytes * frameCount) {
            std::cerr << "[video] Stacked buffer does not match " << frameCount << " frames\n";
            return false;
        }

        outFrames.clear();
        for (size_t i = 0; i < frameCount; i++) {
            std::vector<uint8_t> seg(flat.begin() + i * frameBytes, flat.begin() + (i + 1) * frameBytes);
            cv::Mat frame;
            if (!imgstego::unflattenImage(seg, rows, cols, frame)) {
                return false;
            }
            outFrames.push_back(frame);
        }
        return true;
    }

    uint64_t capacityBitsForFrames(const std::vector<cv::Mat>& frames, int lsbBits, const FramePos* start)
    {
        if (frames.empty()) return 0;

        const uint64_t width = frames[0].cols;
        const uint64_t height = frames[0].rows;
        uint64_t total = stega::capacityBits(frames.size() * width * height * RGB_CHANNELS, lsbBits);
        if (!start) {
            return total;
        }

        uint64_t f = start->frame < 0 ? 0 : start->frame;
        uint64_t x = start->x < 0 ? 0 : start->x;
        uint64_t y = start->y < 0 ? 0 : start->y;
        uint64_t pixelIndex = f * (width * height) + y * width + x;
        uint64_t startBit = pixelIndex * RGB_CHANNELS * lsbBits;
        return startBit >= total ? 0 : total - startBit;
    }

    stega::Error encodeFrames(const std::vector<cv::Mat>& frames,
                              const std::vector<uint8_t>& payload,
                              const std::string& filename,
                              int lsbBits,
                              const std::string& key,
                              const stega::EncodeOptions& options,
                              const FramePos* start,
                              std::vector<cv::Mat>& outFrames,
                              stega::HeaderMeta& outHeader)
    {
        std::vector<uint8_t> stacked;
        int rows = 0, cols = 0;
        if (!stackFrames(frames, stacked, rows, cols)) {
            return stega::Error::UnsupportedImage;
        }

        stega::EncodeOptions opts = options;
        if (start) {
            if (start->frame < 0 || static_cast<size_t>(start->frame) >= frames.size() ||
                start->x < 0 || start->x >= cols || start->y < 0 || start->y >= rows) {
                std::cerr << "[video] Start (frame,x,y) out of bounds: (" << start->frame << ","
                          << start->x << "," << start->y << ")\n";
                return stega::Error::InvalidArgument;
            }
            if (lsbBits < stega::MIN_LSB_BITS || lsbBits > stega::MAX_LSB_BITS) {
                return stega::Error::InvalidLsbBits;
            }
            uint64_t pixelIndex = static_cast<uint64_t>(start->frame) * rows * cols
                                + static_cast<uint64_t>(start->y) * cols + start->x;
            opts.hasStartBit = true;
            opts.startBit = pixelIndex * RGB_CHANNELS * lsbBits;
        }

        stega::Error err = stega::encode(stacked, payload, filename, lsbBits, key, opts, outHeader);
        if (err != stega::Error::Ok) {
            std::cerr << "[video] Embedding failed: " << stega::errorString(err) << "\n";
            return err;
        }

        if (!unstackFrames(stacked, frames.size(), rows, cols, outFrames)) {
            return stega::Error::UnsupportedImage;
        }
        return stega::Error::Ok;
    }

    stega::Error decodeFrames(const std::vector<cv::Mat>& frames,
                              int lsbBits,
                              const std::string& key,
                              const stega::DecodeOptions& options,
                              stega::DecodeResult& out)
    {
        std::vector<uint8_t> stacked;
        int rows = 0, cols = 0;
        if (!stackFrames(frames, stacked, rows, cols)) {
            return stega::Error::UnsupportedImage;
        }
        return stega::decode(stacked, lsbBits, key, options, out);
    }

}
