#ifndef STEGA_PARAMS_HPP
#define STEGA_PARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace stega {

    // STGA header, big-endian
    // magic(4) | version(1) | flags(1) | lsb(1) | start_bit(8) | payload_len(4)
    // | nonce_len(1) | nonce | fname_len(1) | fname | crc32(4)
    constexpr char     HEADER_MAGIC[4]        = {'S', 'T', 'G', 'A'};
    constexpr uint8_t  HEADER_VERSION         = 2;
    constexpr uint8_t  FLAG_PAYLOAD_ENCRYPTED = 0x01;

    constexpr size_t   MAX_FILENAME_LEN  = 100;
    constexpr size_t   MAX_NONCE_LEN     = 32;
    constexpr size_t   DEFAULT_NONCE_LEN = 16;

    constexpr size_t   HEADER_MIN_SIZE = 4 + 1 + 1 + 1 + 8 + 4 + 1 + 1 + 4;               // 25
    constexpr size_t   HEADER_MAX_SIZE = HEADER_MIN_SIZE + MAX_NONCE_LEN + MAX_FILENAME_LEN; // 157

    constexpr int      MIN_LSB_BITS = 1;
    constexpr int      MAX_LSB_BITS = 8;

    // bytes read after the header region when the header cannot be parsed
    constexpr size_t   DEGRADED_READ_BYTES = 32;

    // Honey blob, big-endian
    // magic(6) | R(4) | nonce(8) | universe_len(1) | universe | c(4)
    constexpr char     HONEY_MAGIC[6]   = {'H', 'O', 'N', 'E', 'Y', '1'};
    constexpr size_t   HONEY_MAGIC_LEN  = sizeof(HONEY_MAGIC);
    constexpr size_t   HONEY_NONCE_LEN  = 8;
    constexpr size_t   HONEY_MIN_SIZE   = HONEY_MAGIC_LEN + 4 + HONEY_NONCE_LEN + 1 + 4; // 23
    constexpr size_t   MAX_UNIVERSE_NAME_LEN = 255;
    constexpr uint32_t DEFAULT_R        = 1000000;
    constexpr const char* DEFAULT_UNIVERSE = "default";

    constexpr size_t   SHA256_LEN = 32;

} // namespace stega

#endif // STEGA_PARAMS_HPP
