#pragma once

#include <mutex>
#include <random>
#include <string>

#include "seat_types.hpp"

namespace seating {

/**
 * @brief Produces opaque tokens of the form "<prefix>_<epoch ms>_<9 base-36 chars>".
 *
 * Used for hold batch ids and checkout session ids. Tokens are unique with
 * overwhelming probability across processes; they carry no ordering meaning.
 * Thread-safe.
 */
class IdGenerator {
public:
    IdGenerator();

    std::string next(const std::string& prefix, Timestamp now);

    std::string session_id(Timestamp now) { return next("session", now); }
    std::string batch_id(Timestamp now) { return next("batch", now); }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

} // namespace seating
