#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

/**
 * @brief Scratch directory under the system temp dir, removed with its
 * content on destruction.
 */
class TempDir {
  public:
    TempDir() {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("celleste_test_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return m_path; }

    std::string file(const std::string &name) const {
        return (m_path / name).string();
    }

  private:
    std::filesystem::path m_path;
};
