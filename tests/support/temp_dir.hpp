#pragma once

/// @file temp_dir.hpp
/// @brief Scratch directory removed when the test ends

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace hoard_test {

class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("hoard_" + tag + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Write a file below the directory, creating parents
    std::filesystem::path write(const std::string& relative, const std::string& contents) const {
        std::filesystem::path file = m_path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path m_path;
};

} // namespace hoard_test
