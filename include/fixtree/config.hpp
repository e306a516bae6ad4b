#pragma once

/**
 * FixTree Configuration
 *
 * Run settings for quantization, equivalence checking and the artifacts a
 * run leaves behind. Defaults match the hardware flow: 8-bit features,
 * round-half-up, thresholds one bit wider than the features.
 */

#include "types.hpp"
#include <string>
#include <thread>

namespace fixtree {

// ============================================================================
// Quantization Configuration
// ============================================================================

struct QuantizationConfig {
    uint32_t bit_width = 8;                    // Bits per feature code
    RoundingPolicy rounding = RoundingPolicy::HalfUp;

    // Thresholds carry one fractional bit so they never tie with an input code
    uint32_t threshold_bits() const { return bit_width + 1; }
};

// ============================================================================
// Validation Configuration
// ============================================================================

struct ValidationConfig {
    Float tolerance = 0.0f;                    // Absolute tolerance (regression); 0 = exact
    bool write_details = true;                 // Write the per-sample disagreement log
};

// ============================================================================
// Device Configuration
// ============================================================================

struct DeviceConfig {
    int32_t n_threads = -1;                    // Number of threads (-1 = auto)

    int resolved_threads() const {
        if (n_threads > 0) return n_threads;
        int n = static_cast<int>(std::thread::hardware_concurrency());
        return n > 0 ? n : 1;
    }
};

// ============================================================================
// Main Configuration
// ============================================================================

struct Config {
    QuantizationConfig quantization;
    ValidationConfig validation;
    DeviceConfig device;

    // Verbosity and logging
    int32_t verbosity = 1;                     // 0=silent, 1=progress, 2=debug

    // Run artifacts (empty output_dir = keep everything in memory)
    std::string output_dir = ".";
    std::string run_name = "run";

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static Config hardware_default() {
        return Config();
    }

    static Config with_bits(uint32_t bits) {
        Config cfg;
        cfg.quantization.bit_width = bits;
        return cfg;
    }

    static Config silent() {
        Config cfg;
        cfg.verbosity = 0;
        cfg.output_dir.clear();
        return cfg;
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void validate() const {
        if (quantization.bit_width < 1 || quantization.bit_width > MAX_BIT_WIDTH) {
            throw std::invalid_argument("bit_width must be in [1, 31]");
        }
        if (!(validation.tolerance >= 0.0f)) {
            throw std::invalid_argument("tolerance must be non-negative");
        }
        if (device.n_threads == 0 || device.n_threads < -1) {
            throw std::invalid_argument("n_threads must be positive or -1");
        }
        if (run_name.empty()) {
            throw std::invalid_argument("run_name cannot be empty");
        }
    }
};

} // namespace fixtree
