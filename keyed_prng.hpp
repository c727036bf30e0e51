#ifndef KEYED_PRNG_HPP
#define KEYED_PRNG_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "stega_error.hpp"

namespace stega {

    // Seed sequence reproducing the reference MT19937 init_by_array
    // construction, so std::mt19937 seeded from it yields the reference
    // output stream for the same key words.
    class InitByArraySeq {
    public:
        typedef uint32_t result_type;

        InitByArraySeq() : key_(1, 0) {}
        explicit InitByArraySeq(const std::vector<uint32_t>& key);

        // 64-bit seed as little-endian 32-bit words; zero becomes {0}
        static InitByArraySeq fromSeed(uint64_t seed);

        template <typename It>
        void generate(It begin, It end) const
        {
            std::vector<uint32_t> state = initByArray();
            size_t i = 0;
            for (It it = begin; it != end; ++it) {
                *it = i < state.size() ? state[i] : 0;
                ++i;
            }
        }

        size_t size() const { return key_.size(); }

        template <typename OutIt>
        void param(OutIt dest) const
        {
            for (uint32_t w : key_) *dest++ = w;
        }

    private:
        std::vector<uint32_t> initByArray() const;

        std::vector<uint32_t> key_;
    };

    // Deterministic generator keyed by SHA-256(key || context).
    class KeyedPrng {
    public:
        KeyedPrng(const std::string& key, const std::vector<uint8_t>& context);
        explicit KeyedPrng(uint64_t seed);

        // first 8 bytes of SHA-256(key || context), big-endian
        static uint64_t deriveSeed(const std::string& key, const std::vector<uint8_t>& context);

        uint64_t seed() const { return seed_; }

        uint32_t next32() { return static_cast<uint32_t>(engine_()); }

        // k random bits, 0 <= k <= 64
        uint64_t getRandBits(int k);

        // uniform in [0, n), n > 0, by rejection on bit_length(n) bits
        uint64_t nextBelow(uint64_t n);

        // uniform in [lo, hi); hi <= lo is an error
        Error nextRange(uint64_t lo, uint64_t hi, uint64_t& out);

        // Fisher-Yates over [0, n): for i = n-1 .. 1, swap(i, nextRange(0, i+1))
        std::vector<int> permutationFor(size_t n);

        Error chooseStartBit(uint64_t loInclusive, uint64_t hiExclusive, uint64_t& out);

    private:
        uint64_t seed_;
        std::mt19937 engine_;
    };

} // namespace stega

#endif // KEYED_PRNG_HPP
