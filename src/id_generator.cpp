#include "id_generator.hpp"

#include <chrono>

namespace seating {

IdGenerator::IdGenerator() : rng_(std::random_device{}()) {}

std::string IdGenerator::next(const std::string& prefix, Timestamp now) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static constexpr int kSuffixLen = 9;

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    std::string suffix;
    suffix.reserve(kSuffixLen);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(0, 35);
        for (int i = 0; i < kSuffixLen; ++i) {
            suffix.push_back(kAlphabet[dist(rng_)]);
        }
    }
    return prefix + "_" + std::to_string(ms) + "_" + suffix;
}

} // namespace seating
