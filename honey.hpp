#ifndef HONEY_HPP
#define HONEY_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "stega_error.hpp"
#include "stega_params.hpp"

// Honey encryption: a distribution-transforming encoder over a registered
// message universe. Every key decrypts a blob to some message of the
// universe; only the right key gives back the one that was encrypted.
namespace honey {

    using stega::Error;

    struct Interval {
        uint32_t start;
        uint32_t end;   // exclusive
    };

    struct Universe {
        std::string name;
        std::vector<std::string> messages;
        std::vector<double> probs;
        std::vector<Interval> intervals;
        uint32_t R;

        // index of the first message equal to `message`, or -1
        long indexOf(const std::string& message) const;
    };

    class UniverseRegistry {
    public:
        // Validates and installs a universe, replacing any previous one
        // registered under the same name.
        Error registerUniverse(const std::string& name,
                               const std::vector<std::string>& messages,
                               const std::vector<double>& probs,
                               uint32_t R = stega::DEFAULT_R);

        // nullptr when unknown
        std::shared_ptr<const Universe> get(const std::string& name) const;

        bool contains(const std::string& name) const;

        // sorted
        std::vector<std::string> listNames() const;

    private:
        mutable std::shared_mutex mutex_;
        std::map<std::string, std::shared_ptr<const Universe>> universes_;
    };

    // Installs office_msgs, passwordish, short_notes and default
    Error registerBuiltinUniverses(UniverseRegistry& registry);

    std::vector<double> uniformProbs(size_t count);

    // Interval partition of [0, R) from the probabilities
    Error buildIntervals(const std::vector<double>& probs, uint32_t R, std::vector<Interval>& out);

    // SHA-256(decimal(key) || nonce) as a big-endian integer, mod R
    Error derivePad(int64_t key, const std::vector<uint8_t>& nonce, uint32_t R, uint32_t& outPad);

    bool isHoneyBlob(const std::vector<uint8_t>& data);

    Error heEncrypt(const UniverseRegistry& registry,
                    const std::string& message,
                    int64_t key,
                    const std::string& universeName,
                    std::vector<uint8_t>& outBlob);

    Error heDecrypt(const UniverseRegistry& registry,
                    const std::vector<uint8_t>& blob,
                    int64_t key,
                    std::string& outMessage);

    struct BlobFields {
        uint32_t R;
        std::vector<uint8_t> nonce;
        std::string universe;
        uint32_t c;
    };

    Error parseBlob(const std::vector<uint8_t>& blob, BlobFields& out);

    void serializeBlob(const BlobFields& fields, std::vector<uint8_t>& outBlob);
}

#endif // HONEY_HPP
