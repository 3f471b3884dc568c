#include "file_io.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace tessera {

namespace fs = std::filesystem;

std::error_code input_file_size(const std::string &path, uint64_t &size,
                                std::string &detail) {
  std::error_code ec;
  auto st = fs::status(path, ec);
  if (ec || !fs::exists(st)) {
    detail = "input " + path + " does not exist";
    return errc::not_found;
  }
  if (!fs::is_regular_file(st)) {
    detail = "input " + path + " is not a regular file";
    return errc::io_failure;
  }
  size = fs::file_size(path, ec);
  if (ec) {
    detail = "cannot stat " + path + ": " + ec.message();
    return errc::io_failure;
  }
  return {};
}

std::error_code read_range(const std::string &path, uint64_t offset,
                           uint64_t size, std::vector<uint8_t> &out,
                           std::string &detail) {
  out.assign((size_t)size, 0);
  if (size == 0)
    return {};
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    detail = "cannot open " + path;
    return errc::io_failure;
  }
  f.seekg((std::streamoff)offset);
  if (!f.read(reinterpret_cast<char *>(out.data()), (std::streamsize)size)) {
    detail = "short read of " + std::to_string(size) + " bytes at offset " +
             std::to_string(offset) + " in " + path;
    return errc::io_failure;
  }
  return {};
}

StagedOutput::StagedOutput(std::string final_path)
    : final_(std::move(final_path)) {
  static std::atomic<uint64_t> seq{1};
  staging_ = final_ + ".partial-" + std::to_string((long long)::getpid()) +
             "-" + std::to_string(seq.fetch_add(1));
}

StagedOutput::~StagedOutput() { discard(); }

std::error_code StagedOutput::open(uint64_t total_size, std::string &detail) {
  std::error_code ec;
  fs::path parent = fs::path(final_).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      detail = "cannot create " + parent.string() + ": " + ec.message();
      return errc::io_failure;
    }
  }
  {
    std::ofstream f(staging_, std::ios::binary | std::ios::trunc);
    if (!f) {
      detail = "cannot create " + staging_;
      return errc::io_failure;
    }
  }
  opened_ = true;
  fs::resize_file(staging_, total_size, ec);
  if (ec) {
    detail = "cannot size " + staging_ + ": " + ec.message();
    return errc::io_failure;
  }
  return {};
}

std::error_code StagedOutput::write_at(uint64_t offset,
                                       const std::vector<uint8_t> &data,
                                       std::string &detail) const {
  if (data.empty())
    return {};
  std::fstream f(staging_, std::ios::binary | std::ios::in | std::ios::out);
  if (!f) {
    detail = "cannot open " + staging_ + " for writing";
    return errc::io_failure;
  }
  f.seekp((std::streamoff)offset);
  f.write(reinterpret_cast<const char *>(data.data()),
          (std::streamsize)data.size());
  f.flush();
  if (!f) {
    detail = "short write at offset " + std::to_string(offset) + " of " +
             staging_;
    return errc::io_failure;
  }
  return {};
}

std::error_code StagedOutput::commit(std::string &detail) {
  std::error_code ec;
  fs::rename(staging_, final_, ec);
  if (ec) {
    detail = "cannot promote " + staging_ + " to " + final_ + ": " +
             ec.message();
    return errc::io_failure;
  }
  committed_ = true;
  return {};
}

void StagedOutput::discard() {
  if (!opened_ || committed_)
    return;
  std::error_code ec;
  fs::remove(staging_, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "cannot remove %s: %s",
                           staging_.c_str(), ec.message().c_str());
  opened_ = false;
}

} // namespace tessera
