#include "lfly/pointer.hpp"

#include "lfly/consts.hpp"
#include "lfly/hash.hpp"

#include <charconv>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace lfly {

std::string encode_pointer(const Pointer &p) {
  std::string out;
  out.append(consts::kVersionPrefix).append(consts::kPointerVersion).push_back(consts::kLF);
  out.append(consts::kOidPrefix).append(p.oid).push_back(consts::kLF);
  out.append(consts::kSizePrefix).append(std::to_string(p.size)).push_back(consts::kLF);
  return out;
}

std::optional<Pointer> parse_pointer(std::string_view text) {
  if (text.empty() || text.size() > consts::kMaxPointerSize || text.back() != consts::kLF) {
    return std::nullopt;
  }

  std::vector<std::string_view> lines;
  while (!text.empty()) {
    const auto nl = text.find(consts::kLF);
    lines.push_back(text.substr(0, nl));
    text.remove_prefix(nl + 1);
  }

  // version first; the remaining keys in sorted order, oid and size required
  if (lines.empty() || lines[0] != std::string(consts::kVersionPrefix) + std::string(consts::kPointerVersion)) {
    return std::nullopt;
  }

  Pointer p;
  bool have_oid = false;
  bool have_size = false;
  std::string_view prev_key;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto line = lines[i];
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string_view::npos || sp == 0) {
      return std::nullopt;
    }
    const auto key = line.substr(0, sp);
    const auto value = line.substr(sp + 1);
    if (!prev_key.empty() && key <= prev_key) {
      return std::nullopt;
    }
    prev_key = key;

    if (line.starts_with(consts::kOidPrefix)) {
      p.oid = std::string(line.substr(consts::kOidPrefix.size()));
      if (!looks_oid(p.oid)) {
        return std::nullopt;
      }
      have_oid = true;
    } else if (key == "oid") {
      return std::nullopt; // other hash algorithms are not supported
    } else if (key == "size") {
      const auto *end = value.data() + value.size();
      auto [ptr, ec] = std::from_chars(value.data(), end, p.size);
      if (ec != std::errc{} || ptr != end || p.size < 0) {
        return std::nullopt;
      }
      have_size = true;
    }
  }
  if (!have_oid || !have_size) {
    return std::nullopt;
  }
  return p;
}

std::optional<Pointer> read_pointer_file(const std::filesystem::path &p) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) {
    throw std::runtime_error("stat " + p.string() + ": " + ec.message());
  }
  if (size == 0 || size > consts::kMaxPointerSize) {
    return std::nullopt;
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::string text(static_cast<std::size_t>(size), '\0');
  ifs.read(text.data(), static_cast<std::streamsize>(size));
  if (static_cast<std::uintmax_t>(ifs.gcount()) != size) {
    throw std::runtime_error("short read: " + p.string());
  }
  return parse_pointer(text);
}

} // namespace lfly
