#include "honey.hpp"
#include "crypto.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <mutex>

namespace honey {

    namespace {

        const char* const OFFICE_MSGS[] = {
            "Meeting at 3pm",
            "Budget draft v2",
            "Invoice approved",
            "On leave tomorrow",
            "Lunch order ready",
            "Quarterly report posted",
        };

        const char* const PASSWORDISH[] = {
            "Welcome2025!",
            "SITuser#123",
            "P@sswordReset42",
            "MyLaptop_2024",
            "AlphaOmega77",
            "ChangeMeNow!",
        };

        const char* const SHORT_NOTES[] = {
            "Call the client",
            "Pick up laundry",
            "Printer jam cleared",
            "Remember the tokens",
            "Check server status",
            "Update documentation",
        };

        template <size_t N>
        std::vector<std::string> toVector(const char* const (&items)[N])
        {
            return std::vector<std::string>(items, items + N);
        }

        bool isAscii(const std::string& s)
        {
            for (unsigned char c : s) {
                if (c >= 0x80) return false;
            }
            return true;
        }

        // Compensated sum over the sorted values, independent of input order
        double stableSum(std::vector<double> values)
        {
            std::sort(values.begin(), values.end());
            double sum = 0.0, comp = 0.0;
            for (double v : values) {
                double t = sum + v;
                if (std::fabs(sum) >= std::fabs(v))
                    comp += (sum - t) + v;
                else
                    comp += (v - t) + sum;
                sum = t;
            }
            return sum + comp;
        }

        bool closeToOne(double total)
        {
            const double relTol = 1e-9, absTol = 1e-8;
            double diff = std::fabs(total - 1.0);
            return diff <= std::max(relTol * std::max(std::fabs(total), 1.0), absTol);
        }

        Error messageForSeed(const Universe& u, uint64_t seed, std::string& out)
        {
            if (seed > u.R) {
                return Error::HoneySeedOutOfRange;
            }
            for (size_t i = 0; i < u.intervals.size(); i++) {
                if (u.intervals[i].start <= seed && seed < u.intervals[i].end) {
                    out = u.messages[i];
                    return Error::Ok;
                }
            }
            // seed == R, only reachable from a corrupted lattice
            const Interval& last = u.intervals.back();
            if (seed == u.R && last.start < last.end) {
                out = u.messages.back();
                return Error::Ok;
            }
            return Error::HoneySeedOutOfRange;
        }

        void putU32(std::vector<uint8_t>& out, uint32_t v)
        {
            for (int i = 3; i >= 0; i--) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }

        uint32_t getU32(const std::vector<uint8_t>& in, size_t off)
        {
            uint32_t v = 0;
            for (int i = 0; i < 4; i++) v = (v << 8) | in[off + i];
            return v;
        }

    }

    long Universe::indexOf(const std::string& message) const
    {
        for (size_t i = 0; i < messages.size(); i++) {
            if (messages[i] == message) return static_cast<long>(i);
        }
        return -1;
    }

    // --- registry ---

    Error buildIntervals(const std::vector<double>& probs, uint32_t R, std::vector<Interval>& out)
    {
        if (R == 0) {
            std::cerr << "[honey] R must be positive\n";
            return Error::Validation;
        }
        if (probs.empty()) {
            std::cerr << "[honey] Universe must contain at least one message\n";
            return Error::Validation;
        }

        std::vector<Interval> intervals;
        int64_t total = 0;
        int64_t remainingSlots = R;
        int64_t remainingItems = static_cast<int64_t>(probs.size());

        for (double prob : probs) {
            remainingItems--;

            // round half to even
            int64_t slots = static_cast<int64_t>(std::nearbyint(prob * static_cast<double>(R)));
            if (slots <= 0)
                slots = 1;
            // leave at least one slot for every message still to come
            if (slots > remainingSlots - remainingItems)
                slots = std::max<int64_t>(1, remainingSlots - remainingItems);

            int64_t start = total;
            int64_t end = start + slots;
            if (end > static_cast<int64_t>(UINT32_MAX)) {
                std::cerr << "[honey] Invalid probability distribution; intervals overflow\n";
                return Error::Validation;
            }
            intervals.push_back({static_cast<uint32_t>(start), static_cast<uint32_t>(end)});
            total = end;
            remainingSlots -= slots;
        }

        intervals.back().end = R;
        if (intervals.back().start >= intervals.back().end) {
            std::cerr << "[honey] Invalid probability distribution; intervals collapsed\n";
            return Error::Validation;
        }

        out.swap(intervals);
        return Error::Ok;
    }

    Error UniverseRegistry::registerUniverse(const std::string& name,
                                             const std::vector<std::string>& messages,
                                             const std::vector<double>& probs,
                                             uint32_t R)
    {
        if (name.empty() || name.size() > stega::MAX_UNIVERSE_NAME_LEN || !isAscii(name)) {
            std::cerr << "[honey] Universe name must be non-empty ASCII of at most 255 bytes\n";
            return Error::Validation;
        }
        if (messages.empty()) {
            std::cerr << "[honey] Universe must contain at least one message\n";
            return Error::Validation;
        }
        for (const auto& m : messages) {
            if (m.empty()) {
                std::cerr << "[honey] All universe messages must be non-empty strings\n";
                return Error::Validation;
            }
        }
        if (probs.size() != messages.size()) {
            std::cerr << "[honey] messages and probs must have the same length\n";
            return Error::Validation;
        }
        for (double p : probs) {
            if (!(p > 0.0) || !std::isfinite(p)) {
                std::cerr << "[honey] All probabilities must be positive\n";
                return Error::Validation;
            }
        }
        if (!closeToOne(stableSum(probs))) {
            std::cerr << "[honey] Probabilities must sum to 1.0\n";
            return Error::Validation;
        }

        auto u = std::make_shared<Universe>();
        Error err = buildIntervals(probs, R, u->intervals);
        if (err != Error::Ok)
            return err;

        u->name = name;
        u->messages = messages;
        u->probs = probs;
        u->R = R;

        std::unique_lock<std::shared_mutex> lock(mutex_);
        universes_[name] = std::move(u);
        return Error::Ok;
    }

    std::shared_ptr<const Universe> UniverseRegistry::get(const std::string& name) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = universes_.find(name);
        if (it == universes_.end()) return nullptr;
        return it->second;
    }

    bool UniverseRegistry::contains(const std::string& name) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return universes_.count(name) != 0;
    }

    std::vector<std::string> UniverseRegistry::listNames() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& kv : universes_) {
            names.push_back(kv.first);
        }
        return names;
    }

    std::vector<double> uniformProbs(size_t count)
    {
        if (count == 0) return std::vector<double>();
        return std::vector<double>(count, 1.0 / static_cast<double>(count));
    }

    Error registerBuiltinUniverses(UniverseRegistry& registry)
    {
        std::vector<std::string> office = toVector(OFFICE_MSGS);
        std::vector<std::string> passwords = toVector(PASSWORDISH);
        std::vector<std::string> notes = toVector(SHORT_NOTES);

        Error err = registry.registerUniverse("office_msgs", office, uniformProbs(office.size()));
        if (err == Error::Ok)
            err = registry.registerUniverse("passwordish", passwords, uniformProbs(passwords.size()));
        if (err == Error::Ok)
            err = registry.registerUniverse("short_notes", notes, uniformProbs(notes.size()));
        if (err == Error::Ok)
            err = registry.registerUniverse(stega::DEFAULT_UNIVERSE, notes, uniformProbs(notes.size()));
        return err;
    }

    // --- blob ---

    bool isHoneyBlob(const std::vector<uint8_t>& data)
    {
        return data.size() >= stega::HONEY_MAGIC_LEN
            && std::memcmp(data.data(), stega::HONEY_MAGIC, stega::HONEY_MAGIC_LEN) == 0;
    }

    void serializeBlob(const BlobFields& fields, std::vector<uint8_t>& outBlob)
    {
        outBlob.clear();
        outBlob.reserve(stega::HONEY_MIN_SIZE + fields.universe.size());

        outBlob.insert(outBlob.end(), stega::HONEY_MAGIC, stega::HONEY_MAGIC + stega::HONEY_MAGIC_LEN);
        putU32(outBlob, fields.R);
        outBlob.insert(outBlob.end(), fields.nonce.begin(), fields.nonce.end());
        outBlob.push_back(static_cast<uint8_t>(fields.universe.size()));
        outBlob.insert(outBlob.end(), fields.universe.begin(), fields.universe.end());
        putU32(outBlob, fields.c);
    }

    Error parseBlob(const std::vector<uint8_t>& blob, BlobFields& out)
    {
        if (blob.size() < stega::HONEY_MIN_SIZE) {
            return Error::HoneyTooShort;
        }
        if (!isHoneyBlob(blob)) {
            return Error::HoneyBadMagic;
        }

        size_t off = stega::HONEY_MAGIC_LEN;
        BlobFields f;
        f.R = getU32(blob, off);
        off += 4;
        f.nonce.assign(blob.begin() + off, blob.begin() + off + stega::HONEY_NONCE_LEN);
        off += stega::HONEY_NONCE_LEN;

        size_t univLen = blob[off++];
        if (blob.size() < off + univLen + 4) {
            return Error::HoneyTruncated;
        }
        f.universe.assign(blob.begin() + off, blob.begin() + off + univLen);
        if (!isAscii(f.universe)) {
            return Error::HoneyBadUniverseName;
        }
        off += univLen;

        f.c = getU32(blob, off);
        off += 4;

        if (off != blob.size()) {
            return Error::HoneyTrailingBytes;
        }

        out = f;
        return Error::Ok;
    }

    // --- encrypt / decrypt ---

    Error derivePad(int64_t key, const std::vector<uint8_t>& nonce, uint32_t R, uint32_t& outPad)
    {
        std::string keyText = std::to_string(key);
        std::vector<uint8_t> digest;
        if (!crypto::sha256({std::vector<uint8_t>(keyText.begin(), keyText.end()), nonce}, digest)) {
            return Error::DigestFailure;
        }
        if (!crypto::modBigEndian(digest, R, outPad)) {
            return Error::DigestFailure;
        }
        return Error::Ok;
    }

    Error heEncrypt(const UniverseRegistry& registry,
                    const std::string& message,
                    int64_t key,
                    const std::string& universeName,
                    std::vector<uint8_t>& outBlob)
    {
        std::shared_ptr<const Universe> u = registry.get(universeName);
        if (!u) {
            std::cerr << "[honey] Unknown universe '" << universeName << "'\n";
            return Error::UnknownUniverse;
        }

        long idx = u->indexOf(message);
        if (idx < 0) {
            std::cerr << "[honey] Message is not part of universe '" << u->name << "'\n";
            return Error::MessageNotInUniverse;
        }

        const Interval& iv = u->intervals[idx];
        uint32_t width = iv.end - iv.start;
        if (width == 0) {
            std::cerr << "[honey] Universe interval width is zero\n";
            return Error::Validation;
        }

        uint32_t offset = 0;
        if (!crypto::randomBelow(width, offset)) {
            return Error::RandomFailure;
        }
        uint64_t seed = static_cast<uint64_t>(iv.start) + offset;

        BlobFields f;
        if (!crypto::randomBytes(stega::HONEY_NONCE_LEN, f.nonce)) {
            return Error::RandomFailure;
        }

        uint32_t pad = 0;
        Error err = derivePad(key, f.nonce, u->R, pad);
        if (err != Error::Ok) {
            return err;
        }

        f.R = u->R;
        f.universe = u->name;
        f.c = static_cast<uint32_t>((seed + pad) % u->R);

        serializeBlob(f, outBlob);
        return Error::Ok;
    }

    Error heDecrypt(const UniverseRegistry& registry,
                    const std::vector<uint8_t>& blob,
                    int64_t key,
                    std::string& outMessage)
    {
        BlobFields f;
        Error err = parseBlob(blob, f);
        if (err != Error::Ok) {
            std::cerr << "[honey] " << stega::errorString(err) << "\n";
            return err;
        }

        std::shared_ptr<const Universe> u = registry.get(f.universe);
        if (!u) {
            std::cerr << "[honey] Unknown universe '" << f.universe << "'\n";
            return Error::UnknownUniverse;
        }
        if (f.R != u->R) {
            std::cerr << "[honey] Resolution mismatch for universe '" << f.universe
                      << "' (blob " << f.R << ", registry " << u->R << ")\n";
            return Error::ResolutionMismatch;
        }

        uint32_t pad = 0;
        err = derivePad(key, f.nonce, u->R, pad);
        if (err != Error::Ok) {
            return err;
        }

        // (c - pad) mod R, kept non-negative
        uint64_t seed = (static_cast<uint64_t>(f.c % u->R) + u->R - pad) % u->R;
        return messageForSeed(*u, seed, outMessage);
    }

}
