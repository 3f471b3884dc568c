#include "symbol_store.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>

namespace tessera {

namespace fs = std::filesystem;

std::error_code SymbolStore::prepare(std::string &detail) const {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec || !fs::is_directory(dir_)) {
    detail = "cannot create symbol directory " + dir_ +
             (ec ? ": " + ec.message() : "");
    return errc::io_failure;
  }
  return {};
}

bool SymbolStore::valid_id(const std::string &id) const {
  return is_digest_string(id);
}

std::string SymbolStore::path_for(const std::string &id) const {
  return (fs::path(dir_) / id).string();
}

std::error_code SymbolStore::put(const std::string &id,
                                 const std::vector<uint8_t> &bytes,
                                 std::string &detail) const {
  const std::string path = path_for(id);
  // An existing file is reused only if it still hashes to its name.
  std::error_code ec;
  if (fs::is_regular_file(path, ec) &&
      fs::file_size(path, ec) == bytes.size() && !ec && get(id))
    return {};
  const std::string tmp =
      path + ".tmp" +
      std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      detail = "cannot create symbol file " + tmp;
      return errc::io_failure;
    }
    f.write(reinterpret_cast<const char *>(bytes.data()),
            (std::streamsize)bytes.size());
    f.flush();
    if (!f) {
      detail = "short write to symbol file " + tmp;
      std::error_code ignore;
      fs::remove(tmp, ignore);
      return errc::io_failure;
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    detail = "cannot publish symbol " + id + ": " + ec.message();
    std::error_code ignore;
    fs::remove(tmp, ignore);
    return errc::io_failure;
  }
  return {};
}

std::optional<std::vector<uint8_t>>
SymbolStore::get(const std::string &id) const {
  if (!valid_id(id))
    return std::nullopt;
  const std::string path = path_for(id);
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f)
    return std::nullopt;
  std::streamoff n = f.tellg();
  if (n < 0)
    return std::nullopt;
  std::vector<uint8_t> buf((size_t)n);
  f.seekg(0);
  if (n > 0 && !f.read(reinterpret_cast<char *>(buf.data()), n)) {
    Logger::instance().log(LogLevel::WARN, "symbol %s: short read",
                           id.c_str());
    return std::nullopt;
  }
  if (content_digest(buf) != id) {
    Logger::instance().log(LogLevel::WARN,
                           "symbol %s: content does not match its id, ignored",
                           id.c_str());
    return std::nullopt;
  }
  return buf;
}

} // namespace tessera
