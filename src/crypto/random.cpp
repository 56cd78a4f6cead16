#include "random.hpp"
#include "utils/logger.hpp"
#include <sodium.h>
#include <limits>

namespace ibangen::crypto {

SodiumEntropySource::SodiumEntropySource()
    : initialized_(sodium_init() >= 0) {
    if (!initialized_) {
        IBANGEN_LOG_CRITICAL("Failed to initialize libsodium");
    }
}

SodiumEntropySource& SodiumEntropySource::instance() {
    static SodiumEntropySource source;
    return source;
}

Result<void> SodiumEntropySource::fill(byte* buffer, size_t size) {
    if (!initialized_) {
        return Result<void>::Err(ErrorCode::CryptoInitFailed,
                                 "libsodium is not initialized");
    }
    randombytes_buf(buffer, size);
    return Result<void>::Ok();
}

size_t SecureRandom::bytes_needed(uint64_t range) {
    if (range == 0) {
        return constants::MAX_RANDOM_BYTES;
    }
    if (range == 1) {
        return 0;
    }
    for (size_t n = 1; n < constants::MAX_RANDOM_BYTES; ++n) {
        uint64_t space = uint64_t{1} << (8 * n);
        if (space >= range) {
            return n;
        }
    }
    return constants::MAX_RANDOM_BYTES;
}

uint64_t SecureRandom::max_valid_value(uint64_t range, size_t byte_count) {
    constexpr uint64_t full = std::numeric_limits<uint64_t>::max();

    if (byte_count == 0) {
        return 0;
    }
    if (range == 0) {
        return full;
    }
    if (byte_count >= constants::MAX_RANDOM_BYTES) {
        // 2^64 mod range without overflowing
        uint64_t remainder = (full % range + 1) % range;
        return full - remainder;
    }

    uint64_t space = uint64_t{1} << (8 * byte_count);
    return (space / range) * range - 1;
}

Result<int64_t> SecureRandom::uniform_int(int64_t min, int64_t max) const {
    if (min > max) {
        return Result<int64_t>::Err(
            ErrorCode::RangeError,
            fmt::format("Minimum value {} cannot be greater than maximum value {}", min, max));
    }

    // Wraps to 0 for the full 64-bit span
    uint64_t range = static_cast<uint64_t>(max) - static_cast<uint64_t>(min) + 1;
    size_t byte_count = bytes_needed(range);
    if (byte_count == 0) {
        return Result<int64_t>::Ok(min);
    }

    uint64_t limit = max_valid_value(range, byte_count);
    byte buffer[constants::MAX_RANDOM_BYTES];

    while (true) {
        auto filled = source_->fill(buffer, byte_count);
        if (filled.is_err()) {
            return Result<int64_t>::Err(filled.error());
        }

        // Little-endian
        uint64_t value = 0;
        for (size_t i = 0; i < byte_count; ++i) {
            value |= static_cast<uint64_t>(buffer[i]) << (8 * i);
        }

        if (value > limit) {
            IBANGEN_LOG_TRACE("Rejected draw {} (limit {})", value, limit);
            continue;
        }

        uint64_t offset = range == 0 ? value : value % range;
        return Result<int64_t>::Ok(
            static_cast<int64_t>(static_cast<uint64_t>(min) + offset));
    }
}

Result<std::string> SecureRandom::random_string(int64_t length, const std::string& alphabet) const {
    if (length <= 0) {
        return Result<std::string>::Ok(std::string());
    }

    std::string result;
    result.reserve(static_cast<size_t>(length));

    int64_t last = static_cast<int64_t>(alphabet.size()) - 1;
    for (int64_t i = 0; i < length; ++i) {
        auto index = uniform_int(0, last);
        if (index.is_err()) {
            return Result<std::string>::Err(index.error());
        }
        result += alphabet[static_cast<size_t>(index.value())];
    }
    return Result<std::string>::Ok(std::move(result));
}

} // namespace ibangen::crypto
