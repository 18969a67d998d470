#pragma once
// Shared fixtures for the PluginWarden test executables.

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>

#include "pw/error.h"

namespace pw::test {

  inline int& Failures() {
    static int failures = 0;
    return failures;
  }

  inline void Expect(bool condition, std::string_view what) {
    if (!condition) {
      std::cerr << "FAILED: " << what << std::endl;
      ++Failures();
    }
  }

  // Runs |fn| and checks that it throws pw::Error with |domain| and |code|.
  inline void ExpectError(const std::function<void()>& fn, ErrorDomain domain, int code, std::string_view what) {
    try {
      fn();
    } catch (const Error& err) {
      if (err.domain != domain || err.code != code) {
        std::cerr << "FAILED: " << what << " (unexpected error " << err.code << ": " << err.what() << ")"
                  << std::endl;
        ++Failures();
      }
      return;
    }
    std::cerr << "FAILED: " << what << " (no exception)" << std::endl;
    ++Failures();
  }

  inline int Finish(std::string_view suite) {
    if (Failures() != 0) {
      std::cerr << suite << ": " << Failures() << " failure(s)" << std::endl;
      return 1;
    }
    std::cout << suite << " tests ok" << std::endl;
    return 0;
  }

  class TempDir {
  public:
    explicit TempDir(std::string_view prefix = "pw_test") {
      std::random_device device;
      auto name = std::string(prefix) + "_" +
                  std::to_string(static_cast<unsigned long long>(
                      std::chrono::steady_clock::now().time_since_epoch().count())) +
                  "_" + std::to_string(device());
      path_ = std::filesystem::temp_directory_path() / name;
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
  };

  inline void WriteFile(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
  }

  inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  // Set by the build to the pw-sandbox-unit next to the tests.
  inline std::filesystem::path SandboxUnitPath() {
    return PW_SANDBOX_UNIT_PATH;
  }

} // namespace pw::test
