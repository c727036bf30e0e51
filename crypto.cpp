#include "crypto.hpp"
#include "stega_params.hpp"

#include <openssl/bn.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <zlib.h>

#include <vector>
#include <iostream>
#include <cstring>

namespace crypto {

    bool sha256(const std::vector<std::vector<uint8_t>>& parts, std::vector<uint8_t>& outDigest)
    {
        std::vector<uint8_t> joined;
        for (const auto& part : parts) {
            joined.insert(joined.end(), part.begin(), part.end());
        }

        outDigest.assign(SHA256_DIGEST_LENGTH, 0);
        if (SHA256(joined.data(), joined.size(), outDigest.data()) == nullptr) {
            std::cerr << "[crypto] SHA256 failed\n";
            outDigest.clear();
            return false;
        }
        return true;
    }

    uint32_t crc32(const std::vector<uint8_t>& data)
    {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        const Bytef* p = data.data();
        size_t left = data.size();

        // zlib takes uInt lengths
        while (left > 0) {
            uInt chunk = left > 0x40000000u ? 0x40000000u : static_cast<uInt>(left);
            crc = ::crc32(crc, p, chunk);
            p += chunk;
            left -= chunk;
        }
        return static_cast<uint32_t>(crc & 0xFFFFFFFFu);
    }

    bool keystream(const std::string& key,
                   const std::vector<uint8_t>& nonce,
                   const std::vector<uint8_t>& context,
                   size_t length,
                   std::vector<uint8_t>& outStream)
    {
        outStream.clear();

        if (nonce.empty()) {
            std::cerr << "[crypto] Nonce required for keystream derivation\n";
            return false;
        }

        std::vector<uint8_t> keyBytes(key.begin(), key.end());
        outStream.reserve(length + stega::SHA256_LEN);

        uint64_t counter = 0;
        while (outStream.size() < length) {
            std::vector<uint8_t> ctr(8);
            for (int i = 0; i < 8; i++) {
                ctr[i] = static_cast<uint8_t>(counter >> (56 - 8 * i));
            }

            std::vector<uint8_t> block;
            if (!sha256({keyBytes, nonce, context, ctr}, block)) {
                outStream.clear();
                return false;
            }
            outStream.insert(outStream.end(), block.begin(), block.end());
            counter++;
        }

        outStream.resize(length);
        return true;
    }

    bool encryptPayload(const std::string& key,
                        const std::vector<uint8_t>& nonce,
                        const std::vector<uint8_t>& payload,
                        const std::vector<uint8_t>& context,
                        std::vector<uint8_t>& outData)
    {
        std::vector<uint8_t> stream;
        if (!keystream(key, nonce, context, payload.size(), stream)) {
            return false;
        }

        outData.resize(payload.size());
        for (size_t i = 0; i < payload.size(); i++) {
            outData[i] = payload[i] ^ stream[i];
        }
        return true;
    }

    bool decryptPayload(const std::string& key,
                        const std::vector<uint8_t>& nonce,
                        const std::vector<uint8_t>& payload,
                        const std::vector<uint8_t>& context,
                        std::vector<uint8_t>& outData)
    {
        return encryptPayload(key, nonce, payload, context, outData);
    }

    bool randomBytes(size_t length, std::vector<uint8_t>& out)
    {
        out.assign(length, 0);
        if (length == 0) return true;

        if (RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
            std::cerr << "[crypto] RAND_bytes failed\n";
            out.clear();
            return false;
        }
        return true;
    }

    bool generateNonce(size_t length, std::vector<uint8_t>& outNonce)
    {
        if (length == 0 || length > stega::MAX_NONCE_LEN) {
            std::cerr << "[crypto] Invalid nonce length " << length << "\n";
            outNonce.clear();
            return false;
        }
        return randomBytes(length, outNonce);
    }

    bool randomBelow(uint32_t n, uint32_t& out)
    {
        if (n == 0) {
            std::cerr << "[crypto] randomBelow needs a positive bound\n";
            return false;
        }

        // reject the low end so r % n is unbiased
        const uint32_t threshold = (0u - n) % n;
        for (;;) {
            uint32_t r = 0;
            if (RAND_bytes(reinterpret_cast<unsigned char*>(&r), sizeof(r)) != 1) {
                std::cerr << "[crypto] RAND_bytes failed\n";
                return false;
            }
            if (r >= threshold) {
                out = r % n;
                return true;
            }
        }
    }

    bool modBigEndian(const std::vector<uint8_t>& bytes, uint32_t m, uint32_t& out)
    {
        if (m == 0) {
            std::cerr << "[crypto] Modulus must be positive\n";
            return false;
        }

        BIGNUM* bn = BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr);
        if (!bn) {
            std::cerr << "[crypto] BN_bin2bn failed\n";
            return false;
        }

        BN_ULONG rem = BN_mod_word(bn, static_cast<BN_ULONG>(m));
        BN_free(bn);

        if (rem == static_cast<BN_ULONG>(-1)) {
            std::cerr << "[crypto] BN_mod_word failed\n";
            return false;
        }

        out = static_cast<uint32_t>(rem);
        return true;
    }

}
