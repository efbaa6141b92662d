#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace tandem::sync {

/**
 * @brief Random human-enterable session codes
 *
 * Uppercase letters and digits without the look-alikes 0/O and 1/I.
 * Uniqueness is the caller's job; the repository rejects duplicates.
 */
class SessionCodeGenerator {
public:
    explicit SessionCodeGenerator(std::size_t length = 6)
        : length_(length), rng_(std::random_device{}()) {}

    SessionCodeGenerator(std::size_t length, std::uint64_t seed)
        : length_(length), rng_(seed) {}

    std::string next() {
        static constexpr char alphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
        std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

        std::lock_guard<std::mutex> lk(mu_);
        std::string code;
        code.reserve(length_);
        for (std::size_t i = 0; i < length_; ++i) {
            code.push_back(alphabet[pick(rng_)]);
        }
        return code;
    }

    std::size_t length() const { return length_; }

private:
    std::size_t length_;
    std::mutex mu_;
    std::mt19937_64 rng_;
};

} // namespace tandem::sync
