#include "stega_header.hpp"

#include <cstring>
#include <iostream>

namespace stega {

    namespace {

        const char UTF8_REPLACEMENT[] = "\xEF\xBF\xBD";

        // Length of the well-formed sequence at s[i], or 0 with `bad`
        // set to the size of the maximal ill-formed prefix.
        size_t utf8SequenceAt(const std::string& s, size_t i, size_t& bad)
        {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            bad = 1;

            if (c < 0x80) return 1;

            size_t need;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                need = 1;
            } else if (c >= 0xE0 && c <= 0xEF) {
                need = 2;
                if (c == 0xE0) lo = 0xA0;
                if (c == 0xED) hi = 0x9F;
            } else if (c >= 0xF0 && c <= 0xF4) {
                need = 3;
                if (c == 0xF0) lo = 0x90;
                if (c == 0xF4) hi = 0x8F;
            } else {
                return 0;
            }

            for (size_t k = 1; k <= need; k++) {
                if (i + k >= s.size()) {
                    bad = k;
                    return 0;
                }
                const unsigned char cc = static_cast<unsigned char>(s[i + k]);
                unsigned char l = (k == 1) ? lo : 0x80;
                unsigned char h = (k == 1) ? hi : 0xBF;
                if (cc < l || cc > h) {
                    bad = k;
                    return 0;
                }
            }
            return need + 1;
        }

        std::string utf8Decode(const std::string& s, bool replace)
        {
            std::string out;
            out.reserve(s.size());

            size_t i = 0;
            while (i < s.size()) {
                size_t bad = 0;
                size_t len = utf8SequenceAt(s, i, bad);
                if (len) {
                    out.append(s, i, len);
                    i += len;
                } else {
                    if (replace) out += UTF8_REPLACEMENT;
                    i += bad;
                }
            }
            return out;
        }

        void putU32(std::vector<uint8_t>& out, uint32_t v)
        {
            for (int i = 3; i >= 0; i--) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }

        void putU64(std::vector<uint8_t>& out, uint64_t v)
        {
            for (int i = 7; i >= 0; i--) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }

        uint64_t getBE(const std::vector<uint8_t>& in, size_t off, int n)
        {
            uint64_t v = 0;
            for (int i = 0; i < n; i++) v = (v << 8) | in[off + i];
            return v;
        }

    }

    std::string utf8Sanitize(const std::string& text)
    {
        return utf8Decode(text, false);
    }

    std::string utf8Truncate(const std::string& text, size_t maxBytes)
    {
        if (text.size() <= maxBytes) return utf8Sanitize(text);
        return utf8Sanitize(text.substr(0, maxBytes));
    }

    bool isValidUtf8(const std::string& text)
    {
        return utf8Sanitize(text).size() == text.size();
    }

    HeaderMeta HeaderMeta::normalised() const
    {
        HeaderMeta m = *this;
        m.filename = utf8Truncate(filename, MAX_FILENAME_LEN);
        if (m.nonce.size() > MAX_NONCE_LEN) m.nonce.resize(MAX_NONCE_LEN);
        return m;
    }

    bool HeaderMeta::operator==(const HeaderMeta& other) const
    {
        return lsbBits == other.lsbBits
            && startBitOffset == other.startBitOffset
            && payloadLen == other.payloadLen
            && filename == other.filename
            && crc32 == other.crc32
            && flags == other.flags
            && nonce == other.nonce;
    }

    size_t packedHeaderSize(const HeaderMeta& meta)
    {
        HeaderMeta m = meta.normalised();
        return HEADER_MIN_SIZE + m.nonce.size() + m.filename.size();
    }

    Error packHeader(const HeaderMeta& meta, std::vector<uint8_t>& outBytes)
    {
        HeaderMeta m = meta.normalised();
        if (m.lsbBits < MIN_LSB_BITS || m.lsbBits > MAX_LSB_BITS) {
            std::cerr << "[header] LSB bits must be 1..8, got " << m.lsbBits << "\n";
            return Error::InvalidLsbBits;
        }

        outBytes.clear();
        outBytes.reserve(HEADER_MIN_SIZE + m.nonce.size() + m.filename.size());

        outBytes.insert(outBytes.end(), HEADER_MAGIC, HEADER_MAGIC + sizeof(HEADER_MAGIC));
        outBytes.push_back(HEADER_VERSION);
        outBytes.push_back(m.flags);
        outBytes.push_back(static_cast<uint8_t>(m.lsbBits));
        putU64(outBytes, m.startBitOffset);
        putU32(outBytes, m.payloadLen);

        outBytes.push_back(static_cast<uint8_t>(m.nonce.size()));
        outBytes.insert(outBytes.end(), m.nonce.begin(), m.nonce.end());

        outBytes.push_back(static_cast<uint8_t>(m.filename.size()));
        outBytes.insert(outBytes.end(), m.filename.begin(), m.filename.end());

        putU32(outBytes, m.crc32);
        return Error::Ok;
    }

    Error unpackHeader(const std::vector<uint8_t>& bytes, HeaderMeta& outMeta, size_t& headerSize)
    {
        if (bytes.size() < HEADER_MIN_SIZE) {
            return Error::HeaderTooShort;
        }

        size_t off = 0;
        if (std::memcmp(bytes.data(), HEADER_MAGIC, sizeof(HEADER_MAGIC)) != 0) {
            return Error::BadMagic;
        }
        off += sizeof(HEADER_MAGIC);

        uint8_t version = bytes[off++];
        if (version != HEADER_VERSION) {
            return Error::UnsupportedVersion;
        }

        HeaderMeta m;
        m.flags = bytes[off++];
        m.lsbBits = bytes[off++];
        m.startBitOffset = getBE(bytes, off, 8);
        off += 8;
        m.payloadLen = static_cast<uint32_t>(getBE(bytes, off, 4));
        off += 4;

        size_t nonceLen = bytes[off++];
        if (nonceLen > MAX_NONCE_LEN) {
            return Error::InvalidNonceLength;
        }
        // fname_len(1) + crc32(4) still to come
        if (bytes.size() < off + nonceLen + 1 + 4) {
            return Error::HeaderTooShort;
        }
        m.nonce.assign(bytes.begin() + off, bytes.begin() + off + nonceLen);
        off += nonceLen;

        size_t fnameLen = bytes[off++];
        if (fnameLen > MAX_FILENAME_LEN) {
            return Error::InvalidFilenameLength;
        }
        if (bytes.size() < off + fnameLen + 4) {
            return Error::HeaderTooShort;
        }
        std::string rawName(bytes.begin() + off, bytes.begin() + off + fnameLen);
        m.filename = utf8Decode(rawName, true);
        off += fnameLen;

        m.crc32 = static_cast<uint32_t>(getBE(bytes, off, 4));
        off += 4;

        outMeta = m;
        headerSize = off;
        return Error::Ok;
    }

} // namespace stega
