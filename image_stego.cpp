#include "image_stego.hpp"

#include <opencv2/imgproc.hpp>
#include <vector>
#include <iostream>

namespace imgstego {

    static const int RGB_CHANNELS = 3;

    bool flattenImage(const cv::Mat& img, std::vector<uint8_t>& outFlat, int& rows, int& cols)
    {
        if (img.empty()) {
            std::cerr << "[image] Empty image\n";
            return false;
        }
        if (img.depth() != CV_8U) {
            std::cerr << "[image] Only 8-bit images are supported\n";
            return false;
        }

        cv::Mat rgb;
        switch (img.channels()) {
        case 1: cv::cvtColor(img, rgb, cv::COLOR_GRAY2RGB); break;
        case 3: cv::cvtColor(img, rgb, cv::COLOR_BGR2RGB);  break;
        case 4: cv::cvtColor(img, rgb, cv::COLOR_BGRA2RGB); break;
        default:
            std::cerr << "[image] Unsupported channel count " << img.channels() << "\n";
            return false;
        }
        if (!rgb.isContinuous()) {
            rgb = rgb.clone();
        }

        rows = rgb.rows;
        cols = rgb.cols;
        outFlat.assign(rgb.data, rgb.data + rgb.total() * RGB_CHANNELS);
        return true;
    }

    bool unflattenImage(const std::vector<uint8_t>& flat, int rows, int cols, cv::Mat& outImg)
    {
        if (rows <= 0 || cols <= 0 ||
            flat.size() != static_cast<size_t>(rows) * cols * RGB_CHANNELS) {
            std::cerr << "[image] Flat buffer does not match " << cols << "x" << rows << " RGB\n";
            return false;
        }

        // wraps the buffer; cvtColor writes a fresh BGR image
        cv::Mat rgb(rows, cols, CV_8UC3, const_cast<uint8_t*>(flat.data()));
        cv::cvtColor(rgb, outImg, cv::COLOR_RGB2BGR);
        return true;
    }

    uint64_t capacityBitsForImage(const cv::Mat& img, int lsbBits, const PixelPos* start)
    {
        uint64_t total = stega::capacityBits(img.total() * RGB_CHANNELS, lsbBits);
        if (!start) {
            return total;
        }

        int x = start->x < 0 ? 0 : start->x;
        int y = start->y < 0 ? 0 : start->y;
        uint64_t pixelIndex = static_cast<uint64_t>(y) * img.cols + x;
        uint64_t startBit = pixelIndex * RGB_CHANNELS * lsbBits;
        return startBit >= total ? 0 : total - startBit;
    }

    stega::Error encodeImage(const cv::Mat& cover,
                             const std::vector<uint8_t>& payload,
                             const std::string& filename,
                             int lsbBits,
                             const std::string& key,
                             const stega::EncodeOptions& options,
                             const PixelPos* start,
                             cv::Mat& outStego,
                             stega::HeaderMeta& outHeader)
    {
        std::vector<uint8_t> flat;
        int rows = 0, cols = 0;
        if (!flattenImage(cover, flat, rows, cols)) {
            return stega::Error::UnsupportedImage;
        }

        stega::EncodeOptions opts = options;
        if (start) {
            if (start->x < 0 || start->x >= cols || start->y < 0 || start->y >= rows) {
                std::cerr << "[image] Start (x,y) out of bounds: (" << start->x << "," << start->y
                          << ") for image " << cols << "x" << rows << "\n";
                return stega::Error::InvalidArgument;
            }
            if (lsbBits < stega::MIN_LSB_BITS || lsbBits > stega::MAX_LSB_BITS) {
                return stega::Error::InvalidLsbBits;
            }
            uint64_t pixelIndex = static_cast<uint64_t>(start->y) * cols + start->x;
            opts.hasStartBit = true;
            opts.startBit = pixelIndex * RGB_CHANNELS * lsbBits;
        }

        stega::Error err = stega::encode(flat, payload, filename, lsbBits, key, opts, outHeader);
        if (err != stega::Error::Ok) {
            std::cerr << "[image] Embedding failed: " << stega::errorString(err) << "\n";
            return err;
        }

        if (!unflattenImage(flat, rows, cols, outStego)) {
            return stega::Error::UnsupportedImage;
        }

        std::cout << "[image] Embedded " << payload.size() << " bytes at bit "
                  << outHeader.startBitOffset << " (" << cols << "x" << rows << ", "
                  << lsbBits << " LSB)\n";
        return stega::Error::Ok;
    }

    stega::Error decodeImage(const cv::Mat& stego,
                             int lsbBits,
                             const std::string& key,
                             const stega::DecodeOptions& options,
                             stega::DecodeResult& out)
    {
        std::vector<uint8_t> flat;
        int rows = 0, cols = 0;
        if (!flattenImage(stego, flat, rows, cols)) {
            return stega::Error::UnsupportedImage;
        }
        return stega::decode(flat, lsbBits, key, options, out);
    }

    bool lsbPlane(const cv::Mat& img, int bitIndex, cv::Mat& outPlane)
    {
        if (img.empty() || img.depth() != CV_8U) {
            std::cerr << "[image] Bit planes need a non-empty 8-bit image\n";
            return false;
        }
        if (bitIndex < 0 || bitIndex > 7) {
            std::cerr << "[image] Bit index must be 0..7, got " << bitIndex << "\n";
            return false;
        }

        outPlane.create(img.size(), img.type());
        const int width = img.cols * img.channels();
        for (int y = 0; y < img.rows; ++y) {
            const uchar* src = img.ptr<uchar>(y);
            uchar* dst = outPlane.ptr<uchar>(y);
            for (int i = 0; i < width; ++i) {
                dst[i] = ((src[i] >> bitIndex) & 1) ? 255 : 0;
            }
        }
        return true;
    }

} // namespace imgstego
