#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
// Used to derive per-floor seeds from a run seed without magic hex constants.
//
// Example:
//   uint32_t s = hashCombine(runSeed, tag32("FLOOR"), floorNumber);
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    // N includes the null terminator for string literals.
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

// Random source used by every generation phase.
//
// Generation never touches ambient randomness: callers inject a source, and tests
// can hand in a scripted stream to pin down exact layouts. All helpers draw
// exactly one raw value, so the number of draws never depends on the arguments.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual uint32_t nextU32() = 0;

    // Uniform integer in [0, n). Returns 0 when n <= 1 (a value is still drawn).
    int below(int n) {
        const uint32_t v = nextU32();
        if (n <= 1) return 0;
        return static_cast<int>(v % static_cast<uint32_t>(n));
    }

    // Uniform integer in [lo, hiInclusive].
    int range(int lo, int hiInclusive) {
        const uint32_t v = nextU32();
        if (hiInclusive <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(v % span);
    }

    // True with probability pct/100.
    bool chancePct(int pct) {
        return below(100) < pct;
    }

    bool coin() {
        return (nextU32() >> 31) != 0;
    }
};

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
struct RNG final : RandomSource {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() override {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }
};

// Replays a fixed list of raw values, wrapping around at the end.
class ScriptedRandom final : public RandomSource {
public:
    explicit ScriptedRandom(std::vector<uint32_t> values) : values_(std::move(values)) {}

    uint32_t nextU32() override {
        if (values_.empty()) {
            ++consumed_;
            return 0;
        }
        const uint32_t v = values_[consumed_ % values_.size()];
        ++consumed_;
        return v;
    }

    std::size_t consumed() const { return consumed_; }

private:
    std::vector<uint32_t> values_;
    std::size_t consumed_ = 0;
};

// A tiny integer hash for stable variation.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

inline uint32_t hashCombine(uint32_t a, uint32_t b, uint32_t c) {
    return hashCombine(hashCombine(a, b), c);
}

// Uniform in-place permutation (Fisher-Yates), drawing one value per slot.
template <typename T>
void shuffleInPlace(std::vector<T>& v, RandomSource& rng) {
    if (v.size() < 2) return;
    for (std::size_t i = v.size() - 1; i > 0; --i) {
        const std::size_t j = static_cast<std::size_t>(rng.below(static_cast<int>(i + 1)));
        std::swap(v[i], v[j]);
    }
}
