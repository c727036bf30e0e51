#ifndef BIT_STREAM_HPP
#define BIT_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "stega_error.hpp"

namespace stega {

    // [0, 1, ..., lsbBits-1]
    std::vector<int> identityBitOrder(int lsbBits);

    bool isValidBitOrder(const std::vector<int>& bitOrder, int lsbBits);

    // Bit addressing over the low-order bits of a flat byte buffer.
    // Logical bit i lives in byte i / lsbBits, at bit position
    // bitOrder[i % lsbBits] of that byte. Multi-bit values are MSB first.
    class BitReader {
    public:
        BitReader(const uint8_t* data, size_t size, int lsbBits, const std::vector<int>& bitOrder);

        int lsbBits() const { return lsbBits_; }
        uint64_t totalCapacityBits() const;

        Error readBits(uint64_t pos, int n, uint64_t& value, uint64_t& newPos) const;
        Error readBytes(uint64_t pos, size_t count, std::vector<uint8_t>& out, uint64_t& newPos) const;

    protected:
        Error check(uint64_t pos, uint64_t nbits) const;
        int bitPosition(uint64_t bitIndex) const { return bitOrder_[bitIndex % lsbBits_]; }

        const uint8_t* data_;
        size_t size_;
        int lsbBits_;
        std::vector<int> bitOrder_;
        bool valid_;
    };

    class BitStream : public BitReader {
    public:
        BitStream(uint8_t* data, size_t size, int lsbBits, const std::vector<int>& bitOrder);

        Error writeBits(uint64_t pos, int n, uint64_t value, uint64_t& newPos);
        Error writeBytes(uint64_t pos, const std::vector<uint8_t>& bytes, uint64_t& newPos);

    private:
        uint8_t* mutableData_;
    };

} // namespace stega

#endif // BIT_STREAM_HPP
