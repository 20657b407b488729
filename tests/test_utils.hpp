#ifndef SFT_TEST_UTILS_HPP
#define SFT_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

// Console logging at debug level for test runs
inline void init_logging() {
    sft::logger::init_logging("", boost::log::trivial::debug);
}

inline std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Polls until the predicate holds or the timeout expires
inline bool wait_for(const std::function<bool()>& predicate,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

#endif // SFT_TEST_UTILS_HPP
