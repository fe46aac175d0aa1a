// =============================================================================
// Retina - Fingerprinter
// =============================================================================
#include "vision/fingerprint.hpp"
#include "vision/image_ops.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace retina::vision {

uint64_t fnv1a64(const uint8_t* d, size_t n, uint64_t seed) {
    uint64_t h = seed;
    for (size_t i = 0; i < n; ++i) h = (h ^ d[i]) * 1099511628211ull;
    return h;
}

std::string Fingerprint::toHex() const {
    char buf[24];
    snprintf(buf, sizeof(buf), "0x%016llx", (unsigned long long)value);
    return buf;
}

bool Fingerprint::parseHex(const std::string& s, Fingerprint& out) {
    size_t pos = 0;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) pos = 2;
    if (pos >= s.size() || s.size() - pos > 16) return false;
    uint64_t v = 0;
    for (; pos < s.size(); ++pos) {
        char c = (char)std::tolower((unsigned char)s[pos]);
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else return false;
        v = (v << 4) | (uint64_t)digit;
    }
    out.value = v;
    return true;
}

Result<void> validateFingerprintConfig(const FingerprintConfig& cfg) {
    if (cfg.grid < 2 || cfg.grid > 128) {
        return Error("fingerprint grid must be in [2, 128], got " + std::to_string(cfg.grid),
                     ErrorKind::ConfigError);
    }
    if (cfg.quant_bits < 1 || cfg.quant_bits > 8) {
        return Error("quant_bits must be in [1, 8], got " + std::to_string(cfg.quant_bits),
                     ErrorKind::ConfigError);
    }
    return Ok();
}

Fingerprinter::Fingerprinter(const FingerprintConfig& cfg) : cfg_(cfg) {}

Result<Fingerprint> Fingerprinter::fingerprint(const Frame& frame, const Region* region) const {
    auto gray = toGray(frame, region);
    if (gray.is_err()) return gray.error();
    return hashNormalized(gray.value());
}

Result<Fingerprint> Fingerprinter::fingerprintGray(const cv::Mat& gray) const {
    if (gray.empty() || gray.type() != CV_8UC1) {
        return Error("reference image must be non-empty Gray8", ErrorKind::InvalidFrame);
    }
    return hashNormalized(gray);
}

Fingerprint Fingerprinter::hashNormalized(const cv::Mat& gray) const {
    cv::Mat small = downscale(gray, cfg_.grid, cfg_.grid);

    const int shift = 8 - cfg_.quant_bits;
    std::vector<uint8_t> samples((size_t)cfg_.grid * cfg_.grid);
    for (int y = 0; y < cfg_.grid; ++y) {
        const uint8_t* row = small.ptr<uint8_t>(y);
        for (int x = 0; x < cfg_.grid; ++x) {
            samples[(size_t)y * cfg_.grid + x] = (uint8_t)(row[x] >> shift);
        }
    }

    // Parameters go into the digest so differently tuned fingerprinters never collide
    uint8_t header[2] = {(uint8_t)cfg_.grid, (uint8_t)cfg_.quant_bits};
    uint64_t h = fnv1a64(header, sizeof(header));
    h = fnv1a64(samples.data(), samples.size(), h);
    return Fingerprint{h};
}

} // namespace retina::vision
