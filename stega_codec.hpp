#ifndef STEGA_CODEC_HPP
#define STEGA_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "honey.hpp"
#include "stega_error.hpp"
#include "stega_header.hpp"
#include "stega_params.hpp"

// Embeds a payload into the low-order bits of a flat cover buffer:
//   header at identity bit order from bit 0, payload at the keyed bit order
//   from header.startBitOffset. The caller flattens and reassembles the
//   cover (image pixels, audio samples, video frames).
namespace stega {

    enum class TransformMode {
        Plain,
        Xor,     // keystream cipher, nonce stored in the header
        Honey,   // payload text replaced by a Honey blob
    };

    enum class DecodeMode {
        Permissive,  // keep going on suspicious input, report warnings
        Strict,      // first suspicious condition is an error
    };

    // Digit-only key, required where Honey is involved
    class NumericKey {
    public:
        explicit NumericKey(int64_t value = 0) : value_(value) {}

        // non-empty ASCII digits, value <= INT64_MAX
        static bool parse(const std::string& text, NumericKey& out);

        int64_t value() const { return value_; }
        std::string toString() const { return std::to_string(value_); }

    private:
        int64_t value_;
    };

    struct EncodeOptions {
        TransformMode mode = TransformMode::Plain;
        bool hasStartBit = false;
        uint64_t startBit = 0;
        size_t nonceLength = DEFAULT_NONCE_LEN;
        std::string universe = DEFAULT_UNIVERSE;
        const honey::UniverseRegistry* registry = nullptr;   // Honey only
    };

    struct DecodeOptions {
        DecodeMode mode = DecodeMode::Permissive;
        const honey::UniverseRegistry* registry = nullptr;   // to open Honey blobs
    };

    struct DecodeResult {
        std::vector<uint8_t> payload;
        HeaderMeta header;
        bool headerValid = false;
        Error headerError = Error::Ok;   // why the header could not be parsed
        bool honeyDecoded = false;
        std::vector<Warning> warnings;

        bool hasWarning(WarningKind kind) const;
    };

    uint64_t capacityBits(size_t coverSize, int lsbBits);

    // whole bytes that fit between startBit and the end of the cover
    uint64_t availablePayloadBytes(size_t coverSize, int lsbBits, uint64_t startBit);

    // Lowest payload start: headerBits rounded up to a whole cover byte, so the
    // keyed order never writes into the byte holding the header's last bits
    uint64_t firstPayloadBit(uint64_t headerBits, int lsbBits);

    // Payload bit order: Fisher-Yates over the LSB slots, seeded from SHA-256(key)
    std::vector<int> keyedBitOrder(const std::string& key, int lsbBits);

    // Header at identity bit order from bit 0; no key needed
    Error readHeader(const std::vector<uint8_t>& cover, int lsbBits, HeaderMeta& outMeta, size_t& headerSize);

    // On success the cover holds the embedded header and payload. On error the
    // cover is left untouched.
    Error encode(std::vector<uint8_t>& cover,
                 const std::vector<uint8_t>& payload,
                 const std::string& filename,
                 int lsbBits,
                 const std::string& key,
                 const EncodeOptions& options,
                 HeaderMeta& outHeader);

    Error decode(const std::vector<uint8_t>& cover,
                 int lsbBits,
                 const std::string& key,
                 const DecodeOptions& options,
                 DecodeResult& out);

} // namespace stega

#endif // STEGA_CODEC_HPP
