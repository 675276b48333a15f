// Copyright (c) 2025 The Unicity Foundation
// Shared fixtures for unit and network tests

#ifndef BRIDGERELAY_TEST_HELPERS_HPP
#define BRIDGERELAY_TEST_HELPERS_HPP

#include "chain/header.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace bridgerelay {
namespace test {

/**
 * TempDir - unique scratch directory removed on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string &tag = "bridgerelay_test") {
        static std::atomic<uint64_t> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (tag + "_" + std::to_string(rd()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Deterministic header for block `number`; `salt` varies the roots
inline chain::Header MakeHeader(uint64_t number, uint8_t salt = 0) {
    chain::Header h;
    h.number = number;
    h.timestamp = 1700000000 + number * 12;
    h.prevHeaderHash.data()[0] = static_cast<uint8_t>(number >> 8);
    h.prevHeaderHash.data()[31] = static_cast<uint8_t>(number);
    h.txRoot.data()[0] = 0xaa;
    h.txRoot.data()[31] = static_cast<uint8_t>(number + salt);
    h.receiptsRoot.data()[0] = 0xbb;
    h.receiptsRoot.data()[15] = salt;
    h.receiptsRoot.data()[31] = static_cast<uint8_t>(number * 3);
    return h;
}

// Headers first..last inclusive
inline std::vector<chain::Header> MakeHeaders(uint64_t first, uint64_t last,
                                              uint8_t salt = 0) {
    std::vector<chain::Header> out;
    for (uint64_t n = first; n <= last; ++n) {
        out.push_back(MakeHeader(n, salt));
    }
    return out;
}

// 20-byte id with every byte set to `fill`
inline uint160 MakeAddress(uint8_t fill) {
    uint160 a;
    for (auto &b : a) {
        b = fill;
    }
    return a;
}

inline uint256 MakeHash(uint8_t fill) {
    uint256 h;
    for (auto &b : h) {
        b = fill;
    }
    return h;
}

inline util::LoggerPtr TestLogger(const std::string &component = "default") {
    return util::LogManager::GetLogger(component);
}

} // namespace test
} // namespace bridgerelay

#endif // BRIDGERELAY_TEST_HELPERS_HPP
