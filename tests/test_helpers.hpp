#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace testutil {

namespace fs = std::filesystem;

class TempDir {
  public:
    TempDir()
    {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("tessera-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string path(const std::string &name) const { return (path_ / name).string(); }
    const fs::path &root() const { return path_; }

  private:
    fs::path path_;
};

inline std::vector<std::uint8_t> gen_bytes(std::size_t n, std::uint32_t seed = 1)
{
    std::vector<std::uint8_t> v(n);
    std::uint32_t             x = seed * 2654435761u + 1;
    for (std::size_t i = 0; i < n; ++i)
    {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        v[i] = static_cast<std::uint8_t>(x);
    }
    return v;
}

inline void write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<std::uint8_t> read_file(const std::string &path)
{
    std::ifstream f(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f),
                                     std::istreambuf_iterator<char>());
}

}  // namespace testutil
