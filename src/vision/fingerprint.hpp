// =============================================================================
// Retina - Fingerprint / Fingerprinter
// =============================================================================
// Perceptual digest of a frame or region:
//   gray (format-aware) -> area downscale to grid x grid -> keep top quant_bits
//   -> 64-bit FNV-1a over (grid, quant_bits, samples)
// Visually identical captures (same content after normalization) produce equal
// fingerprints; this is what MatchCache keys on.
// =============================================================================
#pragma once

#include "frame.hpp"
#include "result.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace retina::vision {

struct Fingerprint {
    uint64_t value = 0;

    bool operator==(const Fingerprint& o) const { return value == o.value; }
    bool operator!=(const Fingerprint& o) const { return value != o.value; }

    std::string toHex() const;
    // Accepts "0x..." or bare hex, up to 16 digits
    static bool parseHex(const std::string& s, Fingerprint& out);
};

struct FingerprintConfig {
    int grid = 16;       // normalized side length
    int quant_bits = 4;  // bits kept per sample (1..8)
};

// Validates grid / quant_bits; ConfigError if out of range
Result<void> validateFingerprintConfig(const FingerprintConfig& cfg);

uint64_t fnv1a64(const uint8_t* d, size_t n, uint64_t seed = 14695981039346656037ull);

class Fingerprinter {
public:
    explicit Fingerprinter(const FingerprintConfig& cfg = {});

    // InvalidFrame for zero dimensions, short/long buffers or out-of-bounds region
    Result<Fingerprint> fingerprint(const Frame& frame, const Region* region = nullptr) const;

    // Gray8 reference images (template library input)
    Result<Fingerprint> fingerprintGray(const cv::Mat& gray) const;

    const FingerprintConfig& config() const { return cfg_; }

private:
    Fingerprint hashNormalized(const cv::Mat& gray) const;

    FingerprintConfig cfg_;
};

} // namespace retina::vision

namespace std {
template<>
struct hash<retina::vision::Fingerprint> {
    size_t operator()(const retina::vision::Fingerprint& f) const noexcept {
        return std::hash<uint64_t>{}(f.value);
    }
};
} // namespace std
