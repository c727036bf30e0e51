#include "keyed_prng.hpp"
#include "crypto.hpp"

#include <iostream>
#include <utility>

namespace stega {

    namespace {

        const size_t MT_N = 624;

        int bitLength(uint64_t n)
        {
            int k = 0;
            while (n) {
                k++;
                n >>= 1;
            }
            return k;
        }

        std::mt19937 seededEngine(uint64_t seed)
        {
            InitByArraySeq seq = InitByArraySeq::fromSeed(seed);
            return std::mt19937(seq);
        }

    }

    // --- InitByArraySeq ---
    InitByArraySeq::InitByArraySeq(const std::vector<uint32_t>& key) : key_(key)
    {
        if (key_.empty()) key_.push_back(0);
    }

    InitByArraySeq InitByArraySeq::fromSeed(uint64_t seed)
    {
        std::vector<uint32_t> words;
        while (seed) {
            words.push_back(static_cast<uint32_t>(seed & 0xFFFFFFFFu));
            seed >>= 32;
        }
        return InitByArraySeq(words);
    }

    std::vector<uint32_t> InitByArraySeq::initByArray() const
    {
        std::vector<uint32_t> mt(MT_N);

        // init_genrand(19650218)
        mt[0] = 19650218u;
        for (size_t i = 1; i < MT_N; i++) {
            mt[i] = 1812433253u * (mt[i - 1] ^ (mt[i - 1] >> 30)) + static_cast<uint32_t>(i);
        }

        size_t i = 1, j = 0;
        size_t k = MT_N > key_.size() ? MT_N : key_.size();
        for (; k; k--) {
            mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1664525u))
                    + key_[j] + static_cast<uint32_t>(j);
            i++;
            j++;
            if (i >= MT_N) { mt[0] = mt[MT_N - 1]; i = 1; }
            if (j >= key_.size()) j = 0;
        }
        for (k = MT_N - 1; k; k--) {
            mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1566083941u))
                    - static_cast<uint32_t>(i);
            i++;
            if (i >= MT_N) { mt[0] = mt[MT_N - 1]; i = 1; }
        }

        mt[0] = 0x80000000u;
        return mt;
    }

    // --- KeyedPrng ---
    KeyedPrng::KeyedPrng(const std::string& key, const std::vector<uint8_t>& context)
        : seed_(deriveSeed(key, context)), engine_(seededEngine(seed_))
    {
    }

    KeyedPrng::KeyedPrng(uint64_t seed)
        : seed_(seed), engine_(seededEngine(seed))
    {
    }

    uint64_t KeyedPrng::deriveSeed(const std::string& key, const std::vector<uint8_t>& context)
    {
        std::vector<uint8_t> digest;
        std::vector<uint8_t> keyBytes(key.begin(), key.end());
        if (!crypto::sha256({keyBytes, context}, digest)) {
            // SHA256 only fails on allocation errors
            std::cerr << "[prng] Seed derivation failed, falling back to zero seed\n";
            return 0;
        }

        uint64_t seed = 0;
        for (int i = 0; i < 8; i++) {
            seed = (seed << 8) | digest[i];
        }
        return seed;
    }

    uint64_t KeyedPrng::getRandBits(int k)
    {
        if (k <= 0) return 0;
        if (k > 64) k = 64;

        if (k <= 32) {
            return next32() >> (32 - k);
        }

        // least significant word first
        uint64_t lo = next32();
        int rest = k - 32;
        uint64_t hi = next32();
        if (rest < 32) hi >>= (32 - rest);
        return lo | (hi << 32);
    }

    uint64_t KeyedPrng::nextBelow(uint64_t n)
    {
        if (n == 0) return 0;

        int k = bitLength(n);
        uint64_t r = getRandBits(k);
        while (r >= n) {
            r = getRandBits(k);
        }
        return r;
    }

    Error KeyedPrng::nextRange(uint64_t lo, uint64_t hi, uint64_t& out)
    {
        if (hi <= lo) {
            std::cerr << "[prng] Empty range [" << lo << ", " << hi << ")\n";
            return Error::InvalidArgument;
        }
        out = lo + nextBelow(hi - lo);
        return Error::Ok;
    }

    std::vector<int> KeyedPrng::permutationFor(size_t n)
    {
        std::vector<int> perm;
        for (size_t i = 0; i < n; i++) {
            perm.push_back(static_cast<int>(i));
        }

        for (size_t i = n; i-- > 1;) {
            size_t j = static_cast<size_t>(nextBelow(i + 1));
            std::swap(perm[i], perm[j]);
        }
        return perm;
    }

    Error KeyedPrng::chooseStartBit(uint64_t loInclusive, uint64_t hiExclusive, uint64_t& out)
    {
        return nextRange(loInclusive, hiExclusive, out);
    }

} // namespace stega
