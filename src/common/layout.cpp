#include "layout.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace tessera {

namespace fs = std::filesystem;
using json = nlohmann::json;

bool BlockRecord::operator==(const BlockRecord &o) const {
  return block_id == o.block_id && encoder_parameters == o.encoder_parameters &&
         original_offset == o.original_offset && size == o.size &&
         symbols == o.symbols &&
         source_symbols_count == o.source_symbols_count && hash == o.hash;
}

namespace {

json block_to_json(const BlockRecord &b) {
  return json{{"block_id", b.block_id},
              {"encoder_parameters", b.encoder_parameters},
              {"original_offset", b.original_offset},
              {"size", b.size},
              {"symbols_count", b.symbols.size()},
              {"source_symbols_count", b.source_symbols_count},
              {"symbols", b.symbols},
              {"hash", b.hash}};
}

bool get_u64(const json &obj, const char *key, uint64_t &out,
             std::string &detail) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_unsigned()) {
    detail = std::string("missing or invalid \"") + key + "\"";
    return false;
  }
  out = it->get<uint64_t>();
  return true;
}

bool block_from_json(const json &j, BlockRecord &b, std::string &detail) {
  if (!j.is_object()) {
    detail = "block entry is not an object";
    return false;
  }
  if (!get_u64(j, "block_id", b.block_id, detail) ||
      !get_u64(j, "original_offset", b.original_offset, detail) ||
      !get_u64(j, "size", b.size, detail))
    return false;

  auto params = j.find("encoder_parameters");
  if (params == j.end() || !params->is_array()) {
    detail = "missing or invalid \"encoder_parameters\"";
    return false;
  }
  b.encoder_parameters.clear();
  for (const auto &v : *params) {
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFF) {
      detail = "encoder parameter out of byte range";
      return false;
    }
    b.encoder_parameters.push_back((uint8_t)v.get<uint64_t>());
  }

  auto syms = j.find("symbols");
  if (syms == j.end() || !syms->is_array()) {
    detail = "missing or invalid \"symbols\"";
    return false;
  }
  b.symbols.clear();
  for (const auto &v : *syms) {
    if (!v.is_string() || v.get<std::string>().empty()) {
      detail = "symbol identifier must be a non-empty string";
      return false;
    }
    b.symbols.push_back(v.get<std::string>());
  }

  uint64_t count = 0;
  if (j.contains("symbols_count")) {
    if (!get_u64(j, "symbols_count", count, detail))
      return false;
    if (count != b.symbols.size()) {
      detail = "symbols_count does not match symbols list";
      return false;
    }
  }
  b.source_symbols_count = 0;
  if (j.contains("source_symbols_count")) {
    uint64_t src = 0;
    if (!get_u64(j, "source_symbols_count", src, detail))
      return false;
    if (src > b.symbols.size()) {
      detail = "source_symbols_count exceeds symbols list";
      return false;
    }
    b.source_symbols_count = (uint32_t)src;
  }

  auto hash = j.find("hash");
  if (hash == j.end() || !hash->is_string() ||
      hash->get<std::string>().empty()) {
    detail = "missing or invalid \"hash\"";
    return false;
  }
  b.hash = hash->get<std::string>();
  return true;
}

} // namespace

std::string layout_to_json(const std::vector<BlockRecord> &blocks) {
  std::vector<const BlockRecord *> ordered;
  ordered.reserve(blocks.size());
  for (const auto &b : blocks)
    ordered.push_back(&b);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const BlockRecord *a, const BlockRecord *b) {
                     return a->block_id < b->block_id;
                   });
  json arr = json::array();
  for (const auto *b : ordered)
    arr.push_back(block_to_json(*b));
  return json{{"blocks", arr}}.dump(2, ' ', false, json::error_handler_t::replace);
}

std::error_code layout_from_json(const std::string &text,
                                 std::vector<BlockRecord> &blocks,
                                 std::string &detail) {
  blocks.clear();
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::exception &e) {
    detail = std::string("layout is not valid JSON: ") + e.what();
    return errc::serialization_failure;
  }
  if (!doc.is_object() || !doc.contains("blocks") ||
      !doc["blocks"].is_array()) {
    detail = "layout has no \"blocks\" array";
    return errc::serialization_failure;
  }
  const json &arr = doc["blocks"];
  if (arr.empty()) {
    detail = "layout has no blocks";
    return errc::serialization_failure;
  }
  std::vector<BlockRecord> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); i++) {
    BlockRecord b;
    std::string why;
    if (!block_from_json(arr[i], b, why)) {
      detail = "block entry " + std::to_string(i) + ": " + why;
      return errc::serialization_failure;
    }
    out.push_back(std::move(b));
  }
  std::sort(out.begin(), out.end(),
            [](const BlockRecord &a, const BlockRecord &b) {
              return a.block_id < b.block_id;
            });

  uint64_t expect_offset = 0;
  for (size_t i = 0; i < out.size(); i++) {
    const auto &b = out[i];
    if (b.block_id != i) {
      detail = "block ids are not a dense 0-based sequence at block " +
               std::to_string(b.block_id);
      return errc::serialization_failure;
    }
    if (b.original_offset != expect_offset) {
      detail = "block " + std::to_string(b.block_id) + " starts at offset " +
               std::to_string(b.original_offset) + ", expected " +
               std::to_string(expect_offset);
      return errc::serialization_failure;
    }
    if (b.size > UINT64_MAX - expect_offset) {
      detail = "block " + std::to_string(b.block_id) + " size overflows";
      return errc::serialization_failure;
    }
    expect_offset += b.size;
  }
  blocks = std::move(out);
  return {};
}

std::error_code write_layout(const std::string &path,
                             const std::vector<BlockRecord> &blocks,
                             std::string &detail) {
  const std::string text = layout_to_json(blocks);
  const std::string tmp = path + ".partial";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      detail = "cannot create " + tmp;
      return errc::io_failure;
    }
    f << text << "\n";
    f.flush();
    if (!f) {
      detail = "short write to " + tmp;
      std::error_code ignore;
      fs::remove(tmp, ignore);
      return errc::io_failure;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    detail = "cannot publish layout " + path + ": " + ec.message();
    std::error_code ignore;
    fs::remove(tmp, ignore);
    return errc::io_failure;
  }
  return {};
}

std::error_code read_layout(const std::string &path,
                            std::vector<BlockRecord> &blocks,
                            std::string &detail) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    detail = "layout " + path + " not found";
    return errc::not_found;
  }
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    detail = "cannot open layout " + path;
    return errc::io_failure;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    detail = "cannot read layout " + path;
    return errc::io_failure;
  }
  return layout_from_json(ss.str(), blocks, detail);
}

std::string result_to_json(const ProcessResult &result) {
  json blocks = json::array();
  for (const auto &b : result.blocks)
    blocks.push_back(block_to_json(b));
  json j{{"total_symbols_count", result.total_symbols_count},
         {"total_repair_symbols", result.total_repair_symbols},
         {"symbols_directory", result.symbols_directory},
         {"layout_file_path", result.layout_file_path}};
  if (!result.blocks.empty())
    j["blocks"] = blocks;
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace tessera
