#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace test_utils {

// Unique scratch directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "pagewatch_test") {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << content;
}

}  // namespace test_utils
