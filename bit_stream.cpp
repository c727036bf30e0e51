#include "bit_stream.hpp"
#include "stega_params.hpp"

namespace stega {

    std::vector<int> identityBitOrder(int lsbBits)
    {
        std::vector<int> order;
        for (int i = 0; i < lsbBits; i++) {
            order.push_back(i);
        }
        return order;
    }

    bool isValidBitOrder(const std::vector<int>& bitOrder, int lsbBits)
    {
        if (lsbBits < MIN_LSB_BITS || lsbBits > MAX_LSB_BITS)
            return false;
        if (bitOrder.size() != static_cast<size_t>(lsbBits))
            return false;

        bool seen[MAX_LSB_BITS] = {false};
        for (int pos : bitOrder) {
            if (pos < 0 || pos >= lsbBits || seen[pos])
                return false;
            seen[pos] = true;
        }
        return true;
    }

    // --- BitReader ---
    BitReader::BitReader(const uint8_t* data, size_t size, int lsbBits, const std::vector<int>& bitOrder)
        : data_(data), size_(size), lsbBits_(lsbBits), bitOrder_(bitOrder),
          valid_(isValidBitOrder(bitOrder, lsbBits))
    {
    }

    uint64_t BitReader::totalCapacityBits() const
    {
        if (!valid_) return 0;
        return static_cast<uint64_t>(size_) * static_cast<uint64_t>(lsbBits_);
    }

    Error BitReader::check(uint64_t pos, uint64_t nbits) const
    {
        if (!valid_)
            return Error::InvalidBitOrder;

        uint64_t total = totalCapacityBits();
        if (pos > total || nbits > total - pos)
            return Error::OutOfCapacity;
        return Error::Ok;
    }

    Error BitReader::readBits(uint64_t pos, int n, uint64_t& value, uint64_t& newPos) const
    {
        if (n < 0 || n > 64)
            return Error::InvalidArgument;

        Error err = check(pos, static_cast<uint64_t>(n));
        if (err != Error::Ok)
            return err;

        uint64_t v = 0;
        for (int i = 0; i < n; i++) {
            uint64_t idx = pos + i;
            uint8_t byte = data_[idx / lsbBits_];
            v = (v << 1) | ((byte >> bitPosition(idx)) & 1);
        }

        value = v;
        newPos = pos + n;
        return Error::Ok;
    }

    Error BitReader::readBytes(uint64_t pos, size_t count, std::vector<uint8_t>& out, uint64_t& newPos) const
    {
        if (count > (UINT64_MAX / 8))
            return Error::OutOfCapacity;

        Error err = check(pos, static_cast<uint64_t>(count) * 8);
        if (err != Error::Ok)
            return err;

        out.clear();
        out.reserve(count);

        uint64_t cur = pos;
        for (size_t b = 0; b < count; b++) {
            uint64_t v = 0;
            err = readBits(cur, 8, v, cur);
            if (err != Error::Ok)
                return err;
            out.push_back(static_cast<uint8_t>(v));
        }

        newPos = cur;
        return Error::Ok;
    }

    // --- BitStream ---
    BitStream::BitStream(uint8_t* data, size_t size, int lsbBits, const std::vector<int>& bitOrder)
        : BitReader(data, size, lsbBits, bitOrder), mutableData_(data)
    {
    }

    Error BitStream::writeBits(uint64_t pos, int n, uint64_t value, uint64_t& newPos)
    {
        if (n < 0 || n > 64)
            return Error::InvalidArgument;

        Error err = check(pos, static_cast<uint64_t>(n));
        if (err != Error::Ok)
            return err;

        for (int i = 0; i < n; i++) {
            uint64_t idx = pos + i;
            uint8_t bit = (value >> (n - 1 - i)) & 1;
            int p = bitPosition(idx);
            uint8_t& byte = mutableData_[idx / lsbBits_];
            byte = static_cast<uint8_t>((byte & ~(1 << p)) | (bit << p)); // clear then set
        }

        newPos = pos + n;
        return Error::Ok;
    }

    Error BitStream::writeBytes(uint64_t pos, const std::vector<uint8_t>& bytes, uint64_t& newPos)
    {
        Error err = check(pos, static_cast<uint64_t>(bytes.size()) * 8);
        if (err != Error::Ok)
            return err;

        uint64_t cur = pos;
        for (uint8_t byte : bytes) {
            err = writeBits(cur, 8, byte, cur);
            if (err != Error::Ok)
                return err;
        }

        newPos = cur;
        return Error::Ok;
    }

} // namespace stega
