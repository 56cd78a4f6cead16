#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include <cstdint>
#include <string>

namespace ibangen::crypto {

/**
 * Source of raw random bytes
 * Implementations must be safe to call from several threads at once.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    /**
     * Fill buffer with random bytes
     * @param buffer Buffer to fill
     * @param size Buffer size
     */
    virtual Result<void> fill(byte* buffer, size_t size) = 0;
};

/**
 * libsodium CSPRNG (randombytes_buf)
 */
class SodiumEntropySource : public EntropySource {
public:
    /**
     * Process-wide instance; libsodium is initialized on first use
     */
    static SodiumEntropySource& instance();

    Result<void> fill(byte* buffer, size_t size) override;

    IBANGEN_DISALLOW_COPY_AND_MOVE(SodiumEntropySource);

private:
    SodiumEntropySource();

    bool initialized_;
};

/**
 * Unbiased random integers and strings
 *
 * Draws the minimal number of bytes covering the requested range and
 * rejects draws above the largest multiple of the range, so that the
 * final modulo reduction is uniform.
 */
class SecureRandom {
public:
    explicit SecureRandom(EntropySource& source = SodiumEntropySource::instance())
        : source_(&source) {}

    /**
     * Uniform random integer in [min, max] (inclusive)
     * @return RangeError if min > max
     */
    Result<int64_t> uniform_int(int64_t min, int64_t max) const;

    /**
     * String of `length` characters drawn uniformly from alphabet
     * @return Empty string if length <= 0
     */
    Result<std::string> random_string(int64_t length, const std::string& alphabet) const;

    /**
     * Number of bytes needed to cover range values (0 when range == 1,
     * MAX_RANDOM_BYTES when range == 0, meaning the full 64-bit span)
     */
    static size_t bytes_needed(uint64_t range);

    /**
     * Largest accepted draw for range over byte_count bytes
     */
    static uint64_t max_valid_value(uint64_t range, size_t byte_count);

private:
    EntropySource* source_;
};

} // namespace ibangen::crypto
