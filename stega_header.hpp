#ifndef STEGA_HEADER_HPP
#define STEGA_HEADER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "stega_error.hpp"
#include "stega_params.hpp"

namespace stega {

    struct HeaderMeta {
        int lsbBits = 1;
        uint64_t startBitOffset = 0;
        uint32_t payloadLen = 0;
        std::string filename;           // UTF-8
        uint32_t crc32 = 0;             // of the pre-transform payload
        uint8_t flags = 0;
        std::vector<uint8_t> nonce;

        bool encrypted() const { return (flags & FLAG_PAYLOAD_ENCRYPTED) != 0; }

        // filename cut to MAX_FILENAME_LEN bytes of valid UTF-8,
        // nonce cut to MAX_NONCE_LEN bytes
        HeaderMeta normalised() const;

        bool operator==(const HeaderMeta& other) const;
        bool operator!=(const HeaderMeta& other) const { return !(*this == other); }
    };

    // Drops every byte that is not part of a complete, well-formed UTF-8 sequence
    std::string utf8Sanitize(const std::string& text);

    // At most maxBytes of text, never splitting a code point
    std::string utf8Truncate(const std::string& text, size_t maxBytes);

    bool isValidUtf8(const std::string& text);

    Error packHeader(const HeaderMeta& meta, std::vector<uint8_t>& outBytes);

    // Parses the sequential header at the start of `bytes`.
    // headerSize receives the number of bytes the header occupies.
    Error unpackHeader(const std::vector<uint8_t>& bytes, HeaderMeta& outMeta, size_t& headerSize);

    // Byte length pack would produce for this meta
    size_t packedHeaderSize(const HeaderMeta& meta);

} // namespace stega

#endif // STEGA_HEADER_HPP
