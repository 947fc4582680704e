// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <utility>

#include <bytecheck/core/common/bytes.hpp>

namespace bytecheck::test_util {

//! Unique path under the OS temporary directory
inline std::filesystem::path get_unique_temporary_path(std::string_view prefix = "bytecheck") {
    static std::atomic_uint64_t counter{0};
    const auto now{std::chrono::steady_clock::now().time_since_epoch().count()};
    return std::filesystem::temp_directory_path() /
           (std::string{prefix} + "-" + std::to_string(now) + "-" + std::to_string(counter++));
}

//! Temporary file flushing data after any insertion, removed on destruction
class TemporaryFile {
  public:
    TemporaryFile() : TemporaryFile{get_unique_temporary_path()} {}
    explicit TemporaryFile(std::filesystem::path path)
        : path_{std::move(path)},
          stream_{path_, std::ios::binary} {
        stream_.exceptions(std::ios::failbit | std::ios::badbit);
    }
    ~TemporaryFile() {
        stream_.close();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    void write(ByteView bv) {
        stream_.write(reinterpret_cast<const char*>(bv.data()), static_cast<std::streamsize>(bv.size()));
        stream_.flush();
    }

    void write(std::string_view text) { write(string_view_to_byte_view(text)); }

  private:
    std::filesystem::path path_;
    std::ofstream stream_;
};

//! Temporary directory recursively removed on destruction
class TemporaryDirectory {
  public:
    TemporaryDirectory() : path_{get_unique_temporary_path()} {
        std::filesystem::create_directories(path_);
    }
    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

}  // namespace bytecheck::test_util
