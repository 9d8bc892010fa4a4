#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>

namespace aera::testing {

/// Creates a uniquely named folder under the test temporary directory, removed on destruction
class TempDir {
  public:
    TempDir() : rnd_{std::random_device()()} {
        path_ = std::filesystem::path{::testing::TempDir()} / "aera" / random_string();
        if (!std::filesystem::create_directories(path_)) {
            throw std::runtime_error{"Could not create temp dir"};
        }

        path_ = std::filesystem::absolute(path_);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string random_string() const { return std::to_string(rnd_()); }

    const std::filesystem::path &path() const { return path_; }

  private:
    mutable std::mt19937 rnd_;
    std::filesystem::path path_;
};

} // namespace aera::testing
