#pragma once

#include "crypto/random.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace ibangen::test_support {

/**
 * Entropy source replaying a fixed byte script; fails once exhausted
 */
class ScriptedEntropySource : public crypto::EntropySource {
public:
    explicit ScriptedEntropySource(std::vector<byte> script = {})
        : script_(script.begin(), script.end()) {}

    Result<void> fill(byte* buffer, size_t size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (script_.size() < size) {
            return Result<void>::Err(ErrorCode::EntropySourceFailed, "script exhausted");
        }
        for (size_t i = 0; i < size; ++i) {
            buffer[i] = script_.front();
            script_.pop_front();
        }
        return Result<void>::Ok();
    }

    size_t calls() const { return calls_; }
    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return script_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<byte> script_;
    std::atomic<size_t> calls_{0};
};

/**
 * Counts draws while forwarding to another source
 */
class CountingEntropySource : public crypto::EntropySource {
public:
    explicit CountingEntropySource(crypto::EntropySource& inner) : inner_(inner) {}

    Result<void> fill(byte* buffer, size_t size) override {
        ++calls_;
        return inner_.fill(buffer, size);
    }

    size_t calls() const { return calls_; }

private:
    crypto::EntropySource& inner_;
    std::atomic<size_t> calls_{0};
};

/**
 * Always fails, as a broken system CSPRNG would
 */
class FailingEntropySource : public crypto::EntropySource {
public:
    Result<void> fill(byte*, size_t) override {
        return Result<void>::Err(ErrorCode::EntropySourceFailed, "entropy unavailable");
    }
};

} // namespace ibangen::test_support
