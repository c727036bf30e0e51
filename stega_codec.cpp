#include "stega_codec.hpp"
#include "bit_stream.hpp"
#include "crypto.hpp"
#include "keyed_prng.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>

namespace stega {

    namespace {

        bool validLsb(int lsbBits)
        {
            return lsbBits >= MIN_LSB_BITS && lsbBits <= MAX_LSB_BITS;
        }

        std::vector<uint8_t> toBytes(const std::string& s)
        {
            return std::vector<uint8_t>(s.begin(), s.end());
        }

        // Records a warning and keeps going, or in strict mode hands back
        // strictErr for the caller to return.
        bool tolerate(const DecodeOptions& options, DecodeResult& out, WarningKind kind,
                      const std::string& message, Error strictErr, Error& err)
        {
            if (options.mode == DecodeMode::Strict) {
                std::cerr << "[decode] " << message << "\n";
                err = strictErr;
                return false;
            }
            out.warnings.push_back({kind, message});
            return true;
        }

        Error applyTransform(const std::vector<uint8_t>& payload,
                             const std::string& filename,
                             const std::string& key,
                             const EncodeOptions& options,
                             std::vector<uint8_t>& outData,
                             uint8_t& outFlags,
                             std::vector<uint8_t>& outNonce)
        {
            outFlags = 0;
            outNonce.clear();

            switch (options.mode) {
            case TransformMode::Plain:
                outData = payload;
                return Error::Ok;

            case TransformMode::Xor:
                if (!crypto::generateNonce(options.nonceLength, outNonce)) {
                    return Error::InvalidNonce;
                }
                if (!crypto::encryptPayload(key, outNonce, payload, toBytes(filename), outData)) {
                    return Error::InvalidNonce;
                }
                outFlags |= FLAG_PAYLOAD_ENCRYPTED;
                return Error::Ok;

            case TransformMode::Honey: {
                NumericKey numeric;
                if (!NumericKey::parse(key, numeric)) {
                    std::cerr << "[encode] Honey mode needs a numeric key\n";
                    return Error::InvalidKey;
                }
                if (!options.registry) {
                    std::cerr << "[encode] Honey mode needs a universe registry\n";
                    return Error::UnknownUniverse;
                }
                std::string text(payload.begin(), payload.end());
                if (!isValidUtf8(text)) {
                    std::cerr << "[encode] Honey payload must be UTF-8 text\n";
                    return Error::NotUtf8;
                }
                return honey::heEncrypt(*options.registry, text, numeric.value(), options.universe, outData);
            }
            }
            return Error::InvalidArgument;
        }

        std::string describe(uint64_t expected, uint64_t actual)
        {
            std::ostringstream ss;
            ss << std::hex << "expected 0x" << expected << ", got 0x" << actual;
            return ss.str();
        }

    }

    bool NumericKey::parse(const std::string& text, NumericKey& out)
    {
        if (text.empty()) return false;

        const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        uint64_t v = 0;
        for (char ch : text) {
            if (ch < '0' || ch > '9') return false;
            uint64_t digit = static_cast<uint64_t>(ch - '0');
            if (v > (limit - digit) / 10) return false;
            v = v * 10 + digit;
        }

        out = NumericKey(static_cast<int64_t>(v));
        return true;
    }

    bool DecodeResult::hasWarning(WarningKind kind) const
    {
        for (const auto& w : warnings) {
            if (w.kind == kind) return true;
        }
        return false;
    }

    uint64_t capacityBits(size_t coverSize, int lsbBits)
    {
        if (!validLsb(lsbBits)) return 0;
        return static_cast<uint64_t>(coverSize) * static_cast<uint64_t>(lsbBits);
    }

    uint64_t availablePayloadBytes(size_t coverSize, int lsbBits, uint64_t startBit)
    {
        uint64_t total = capacityBits(coverSize, lsbBits);
        if (startBit >= total) return 0;
        return (total - startBit) / 8;
    }

    uint64_t firstPayloadBit(uint64_t headerBits, int lsbBits)
    {
        if (!validLsb(lsbBits)) return headerBits;
        const uint64_t lsb = static_cast<uint64_t>(lsbBits);
        return (headerBits + lsb - 1) / lsb * lsb;
    }

    std::vector<int> keyedBitOrder(const std::string& key, int lsbBits)
    {
        KeyedPrng prng(key, std::vector<uint8_t>());
        return prng.permutationFor(static_cast<size_t>(lsbBits));
    }

    Error readHeader(const std::vector<uint8_t>& cover, int lsbBits, HeaderMeta& outMeta, size_t& headerSize)
    {
        if (!validLsb(lsbBits)) {
            return Error::InvalidLsbBits;
        }

        BitReader reader(cover.data(), cover.size(), lsbBits, identityBitOrder(lsbBits));
        uint64_t fitBytes = reader.totalCapacityBits() / 8;
        size_t count = static_cast<size_t>(std::min<uint64_t>(fitBytes, HEADER_MAX_SIZE));

        std::vector<uint8_t> raw;
        uint64_t next = 0;
        Error err = reader.readBytes(0, count, raw, next);
        if (err != Error::Ok) {
            return err;
        }
        return unpackHeader(raw, outMeta, headerSize);
    }

    Error encode(std::vector<uint8_t>& cover,
                 const std::vector<uint8_t>& payload,
                 const std::string& filename,
                 int lsbBits,
                 const std::string& key,
                 const EncodeOptions& options,
                 HeaderMeta& outHeader)
    {
        if (!validLsb(lsbBits)) {
            std::cerr << "[encode] LSB bits must be 1..8, got " << lsbBits << "\n";
            return Error::InvalidLsbBits;
        }
        if (key.empty()) {
            std::cerr << "[encode] Key must be non-empty\n";
            return Error::InvalidKey;
        }

        // the header stores the normalised name; the keystream context must match it
        const std::string fname = utf8Truncate(filename, MAX_FILENAME_LEN);

        std::vector<uint8_t> data;
        uint8_t flags = 0;
        std::vector<uint8_t> nonce;
        Error err = applyTransform(payload, fname, key, options, data, flags, nonce);
        if (err != Error::Ok) {
            return err;
        }
        if (data.size() > std::numeric_limits<uint32_t>::max()) {
            std::cerr << "[encode] Payload longer than 4 GiB\n";
            return Error::CapacityExceeded;
        }

        HeaderMeta header;
        header.lsbBits = lsbBits;
        header.startBitOffset = 0;
        header.payloadLen = static_cast<uint32_t>(data.size());
        header.filename = fname;
        header.crc32 = crypto::crc32(payload);
        header.flags = flags;
        header.nonce = nonce;

        // placeholder pack to learn the header length
        std::vector<uint8_t> headerBytes;
        err = packHeader(header, headerBytes);
        if (err != Error::Ok) {
            return err;
        }
        const uint64_t headerBits = static_cast<uint64_t>(headerBytes.size()) * 8;
        const uint64_t payloadBits = static_cast<uint64_t>(data.size()) * 8;
        const uint64_t totalBits = capacityBits(cover.size(), lsbBits);

        // payload starts on the first LSB group the header does not touch
        const uint64_t floorBit = firstPayloadBit(headerBits, lsbBits);
        if (floorBit > totalBits || payloadBits > totalBits - floorBit) {
            std::cerr << "[encode] Not enough capacity: need " << floorBit + payloadBits
                      << " bits, have " << totalBits << " bits\n";
            return Error::CapacityExceeded;
        }

        // permutation first: the decoder rebuilds it from the same first draws
        KeyedPrng prng(key, std::vector<uint8_t>());
        std::vector<int> perm = prng.permutationFor(static_cast<size_t>(lsbBits));

        uint64_t startBit = 0;
        if (options.hasStartBit) {
            startBit = options.startBit;
            if (startBit < floorBit) {
                std::cerr << "[encode] Start bit " << startBit << " overlaps the header ("
                          << headerBits << " bits, first free bit " << floorBit << ")\n";
                return Error::CapacityExceeded;
            }
            if (startBit > totalBits || payloadBits > totalBits - startBit) {
                std::cerr << "[encode] Selected start position too late for payload\n";
                return Error::CapacityExceeded;
            }
        } else {
            err = prng.chooseStartBit(floorBit, totalBits - payloadBits + 1, startBit);
            if (err != Error::Ok) {
                return err;
            }
        }

        header.startBitOffset = startBit;
        std::vector<uint8_t> finalBytes;
        err = packHeader(header, finalBytes);
        if (err != Error::Ok) {
            return err;
        }
        if (finalBytes.size() != headerBytes.size()) {
            std::cerr << "[encode] Header size changed unexpectedly\n";
            return Error::HeaderSizeChanged;
        }

        HeaderMeta parsed;
        size_t parsedSize = 0;
        err = unpackHeader(finalBytes, parsed, parsedSize);
        if (err != Error::Ok || parsed.crc32 != header.crc32 || parsedSize != finalBytes.size()) {
            std::cerr << "[encode] Header CRC mismatch after pack/unpack\n";
            return Error::HeaderSizeChanged;
        }

        // embed into a copy so a failure leaves the caller's cover untouched
        std::vector<uint8_t> work(cover);
        uint64_t next = 0;

        BitStream headerStream(work.data(), work.size(), lsbBits, identityBitOrder(lsbBits));
        err = headerStream.writeBytes(0, finalBytes, next);
        if (err != Error::Ok) {
            std::cerr << "[encode] Writing header failed: " << errorString(err) << "\n";
            return err;
        }

        BitStream payloadStream(work.data(), work.size(), lsbBits, perm);
        err = payloadStream.writeBytes(startBit, data, next);
        if (err != Error::Ok) {
            std::cerr << "[encode] Writing payload failed: " << errorString(err) << "\n";
            return err;
        }

        cover.swap(work);
        outHeader = parsed;
        return Error::Ok;
    }

    Error decode(const std::vector<uint8_t>& cover,
                 int lsbBits,
                 const std::string& key,
                 const DecodeOptions& options,
                 DecodeResult& out)
    {
        out = DecodeResult();

        if (!validLsb(lsbBits)) {
            std::cerr << "[decode] LSB bits must be 1..8, got " << lsbBits << "\n";
            return Error::InvalidLsbBits;
        }
        if (key.empty()) {
            std::cerr << "[decode] Key must be non-empty\n";
            return Error::InvalidKey;
        }

        Error err = Error::Ok;
        HeaderMeta meta;
        size_t headerSize = 0;
        Error headerErr = readHeader(cover, lsbBits, meta, headerSize);

        if (headerErr != Error::Ok) {
            out.headerError = headerErr;
            std::string msg = std::string("header unreadable (") + errorString(headerErr) + ")";
            if (options.mode == DecodeMode::Strict) {
                std::cerr << "[decode] " << msg << "\n";
                return headerErr;
            }
            out.warnings.push_back({WarningKind::HeaderUnreadable,
                                    msg + "; best-effort read after the header region"});

            // degraded: no flags, a bounded read right after the minimal header
            const uint64_t start = static_cast<uint64_t>(HEADER_MIN_SIZE) * 8;
            uint64_t count = std::min<uint64_t>(DEGRADED_READ_BYTES,
                                                availablePayloadBytes(cover.size(), lsbBits, start));
            out.header.lsbBits = lsbBits;
            out.header.startBitOffset = start;
            out.header.payloadLen = static_cast<uint32_t>(count);

            if (count == 0) {
                return Error::Ok;
            }
            BitReader reader(cover.data(), cover.size(), lsbBits, keyedBitOrder(key, lsbBits));
            uint64_t next = 0;
            return reader.readBytes(start, static_cast<size_t>(count), out.payload, next);
        }

        out.header = meta;
        out.headerValid = true;

        // payload addressed with the header's own LSB count when it is usable
        int payloadLsb = lsbBits;
        if (meta.lsbBits != lsbBits) {
            std::ostringstream ss;
            ss << "header declares " << meta.lsbBits << " LSB bits, decoder configured with " << lsbBits;
            if (validLsb(meta.lsbBits)) {
                payloadLsb = meta.lsbBits;
                ss << "; payload read with " << payloadLsb;
            } else {
                ss << "; declared value unusable, payload read with " << lsbBits;
            }
            if (!tolerate(options, out, WarningKind::LsbMismatch, ss.str(), Error::LsbMismatch, err))
                return err;
        }

        // header cover bytes, expressed in payload-addressing bits
        const uint64_t headerBits = static_cast<uint64_t>(headerSize) * 8;
        const uint64_t headerCoverBytes = (headerBits + lsbBits - 1) / lsbBits;
        const uint64_t overlapBit = headerCoverBytes * static_cast<uint64_t>(payloadLsb);
        if (meta.startBitOffset < overlapBit) {
            std::ostringstream ss;
            ss << "start bit " << meta.startBitOffset << " lies inside the header (" << headerBits
               << " bits, first free bit " << overlapBit << ")";
            if (!tolerate(options, out, WarningKind::StartOffsetOverlap, ss.str(), Error::StartOffsetOverlap, err))
                return err;
        }

        uint64_t payloadLen = meta.payloadLen;
        const uint64_t avail = availablePayloadBytes(cover.size(), payloadLsb, meta.startBitOffset);
        if (payloadLen > avail) {
            std::ostringstream ss;
            ss << "payload length " << payloadLen << " clamped to remaining capacity " << avail;
            if (!tolerate(options, out, WarningKind::PayloadClamped, ss.str(), Error::PayloadClamped, err))
                return err;
            payloadLen = avail;
        }

        std::vector<uint8_t> data;
        if (payloadLen > 0) {
            BitReader reader(cover.data(), cover.size(), payloadLsb, keyedBitOrder(key, payloadLsb));
            uint64_t next = 0;
            err = reader.readBytes(meta.startBitOffset, static_cast<size_t>(payloadLen), data, next);
            if (err != Error::Ok) {
                std::cerr << "[decode] Reading payload failed: " << errorString(err) << "\n";
                return err;
            }
        }

        std::vector<uint8_t> plain;
        if (meta.encrypted()) {
            if (!crypto::decryptPayload(key, meta.nonce, data, toBytes(meta.filename), plain)) {
                if (!tolerate(options, out, WarningKind::DecryptFailed,
                              "payload flagged encrypted but cannot be decrypted; returning raw bytes",
                              Error::InvalidNonce, err))
                    return err;
                plain = data;
            }
        } else {
            plain.swap(data);
        }

        std::vector<uint8_t> recovered;
        if (honey::isHoneyBlob(plain)) {
            NumericKey numeric;
            std::string message;
            Error honeyErr = Error::Ok;
            if (!NumericKey::parse(key, numeric)) {
                honeyErr = Error::InvalidKey;
            } else if (!options.registry) {
                honeyErr = Error::UnknownUniverse;
            } else {
                honeyErr = honey::heDecrypt(*options.registry, plain, numeric.value(), message);
            }

            if (honeyErr == Error::Ok) {
                recovered.assign(message.begin(), message.end());
                out.honeyDecoded = true;
            } else {
                std::string msg = std::string("Honey blob not decoded (") + errorString(honeyErr)
                                  + "); returning raw bytes";
                if (!tolerate(options, out, WarningKind::HoneyDecodeFailed, msg, honeyErr, err))
                    return err;
                recovered.swap(plain);
            }
        } else {
            recovered.swap(plain);
        }

        uint32_t crc = crypto::crc32(recovered);
        if (crc != meta.crc32) {
            if (!tolerate(options, out, WarningKind::IntegrityCheckFailed,
                          "integrity check failed: CRC32 " + describe(meta.crc32, crc),
                          Error::IntegrityCheckFailed, err))
                return err;
        }

        out.payload.swap(recovered);
        return Error::Ok;
    }

} // namespace stega
