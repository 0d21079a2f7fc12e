#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace lfly::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Inflate a gzip (RFC 1952) or zlib stream, as sent with Content-Encoding: gzip
std::string z_gunzip(std::span<const std::uint8_t> data);

// Random lowercase hex of `n` chars, for scratch file names
std::string random_hex(std::size_t n);

} // namespace lfly::fs
