/**
 * @file StagingDirectory.cpp
 * @brief Implementation of StagingDirectory.
 */

#include "infrastructure/StagingDirectory.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

namespace solverify::infrastructure {

namespace {

std::string UniqueName() {
    static std::atomic<unsigned long> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};
    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    return "solverify-staging-" + std::to_string(now) + "-" + std::to_string(counter++) + "-" +
           std::to_string(rng() % 1000000);
}

} // namespace

StagingDirectory::StagingDirectory(const fs::path& parent) {
    fs::create_directories(parent);
    // create_directory reports false when the name is taken; pick another.
    do {
        m_path = parent / UniqueName();
    } while (!fs::create_directory(m_path));
}

StagingDirectory::~StagingDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[StagingDirectory] Failed to remove " << m_path << ": " << ec.message() << std::endl;
    }
}

} // namespace solverify::infrastructure
