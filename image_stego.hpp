#ifndef IMAGE_STEGO_HPP
#define IMAGE_STEGO_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "stega_codec.hpp"

// Cover adapter for decoded images: every cover is flattened row-major with
// per-pixel channel order R, G, B before it reaches the codec.
namespace imgstego {

    struct PixelPos {
        int x;
        int y;
    };

    // 8-bit grey, BGR or BGRA in; RGB bytes out. Grey is expanded to three
    // equal channels and alpha is dropped before embedding.
    bool flattenImage(const cv::Mat& img, std::vector<uint8_t>& outFlat, int& rows, int& cols);

    // RGB bytes back to an 8-bit BGR image
    bool unflattenImage(const std::vector<uint8_t>& flat, int rows, int cols, cv::Mat& outImg);

    // LSB bits from `start` (or the first pixel) to the end of the image
    uint64_t capacityBitsForImage(const cv::Mat& img, int lsbBits, const PixelPos* start = nullptr);

    // `start` picks the payload position as a pixel; nullptr lets the key choose.
    // outStego is always 8-bit 3-channel BGR: a grey or BGRA cover comes back
    // without its single-channel form or its alpha plane.
    stega::Error encodeImage(const cv::Mat& cover,
                             const std::vector<uint8_t>& payload,
                             const std::string& filename,
                             int lsbBits,
                             const std::string& key,
                             const stega::EncodeOptions& options,
                             const PixelPos* start,
                             cv::Mat& outStego,
                             stega::HeaderMeta& outHeader);

    stega::Error decodeImage(const cv::Mat& stego,
                             int lsbBits,
                             const std::string& key,
                             const stega::DecodeOptions& options,
                             stega::DecodeResult& out);

    // Bit plane `bitIndex` of every channel as 0 / 255
    bool lsbPlane(const cv::Mat& img, int bitIndex, cv::Mat& outPlane);

}

#endif // IMAGE_STEGO_HPP
