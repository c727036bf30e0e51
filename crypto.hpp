#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace crypto {

    // SHA-256 over the concatenation of the given parts
    bool sha256(const std::vector<std::vector<uint8_t>>& parts, std::vector<uint8_t>& outDigest);

    // zlib CRC32 (IEEE)
    uint32_t crc32(const std::vector<uint8_t>& data);

    // Keystream of `length` bytes:
    //   block_i = SHA256(key || nonce || context || i as u64 big-endian), i = 0, 1, ...
    // concatenated and truncated. Fails on an empty nonce.
    bool keystream(const std::string& key,
                   const std::vector<uint8_t>& nonce,
                   const std::vector<uint8_t>& context,
                   size_t length,
                   std::vector<uint8_t>& outStream);

    // payload XOR keystream; applying it twice gives back the payload
    bool encryptPayload(const std::string& key,
                        const std::vector<uint8_t>& nonce,
                        const std::vector<uint8_t>& payload,
                        const std::vector<uint8_t>& context,
                        std::vector<uint8_t>& outData);

    bool decryptPayload(const std::string& key,
                        const std::vector<uint8_t>& nonce,
                        const std::vector<uint8_t>& payload,
                        const std::vector<uint8_t>& context,
                        std::vector<uint8_t>& outData);

    // 1 <= length <= 32 bytes from the OS CSPRNG
    bool generateNonce(size_t length, std::vector<uint8_t>& outNonce);

    bool randomBytes(size_t length, std::vector<uint8_t>& out);

    // Uniform integer in [0, n), n > 0
    bool randomBelow(uint32_t n, uint32_t& out);

    // Big-endian unsigned integer `bytes` reduced mod m, m > 0
    bool modBigEndian(const std::vector<uint8_t>& bytes, uint32_t m, uint32_t& out);
}

#endif
