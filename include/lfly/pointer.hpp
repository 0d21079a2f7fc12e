#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lfly {

// The small text file committed in place of a large object.
struct Pointer {
  std::string oid;
  std::int64_t size = 0;

  auto operator==(const Pointer &) const -> bool = default;
};

// version https://git-lfs.github.com/spec/v1\noid sha256:<oid>\nsize <n>\n
auto encode_pointer(const Pointer &p) -> std::string;

// nullopt unless `text` is a well-formed pointer.
auto parse_pointer(std::string_view text) -> std::optional<Pointer>;

// Parses the file when it is small enough to be a pointer. Throws on read errors.
auto read_pointer_file(const std::filesystem::path &p) -> std::optional<Pointer>;

} // namespace lfly
