#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lfly::consts {

// Directory and file names
inline constexpr std::string_view kStateDir   = ".lfly";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kTmpDir     = "tmp";
inline constexpr std::string_view kBadDir     = "bad";
inline constexpr std::string_view kConfigFile = "config";

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 32;  // 32 bytes (SHA-256)
inline constexpr std::size_t kOidHexLen = 64;  // 64 hex chars (SHA-256)

// Object store fanout
// objects/aa/bb/aabb...: two levels of two hex chars each
inline constexpr std::size_t kFanoutDirHexLen = 2;
inline constexpr std::size_t kFanoutLevels    = 2;

// Transfer defaults
inline constexpr int kDefaultBatchSize          = 100;
inline constexpr int kDefaultMaxAttempts        = 2;
inline constexpr int kDefaultConcurrentTransfers = 3;
inline constexpr int kDefaultHttpTimeoutSeconds = 30;

inline constexpr std::size_t kCopyBufferSize = 32 * 1024;

// Transfer kinds / adapter names
inline constexpr std::string_view kUpload   = "upload";
inline constexpr std::string_view kDownload = "download";
inline constexpr std::string_view kVerify   = "verify";
inline constexpr std::string_view kBasicAdapter = "basic";

// Batch API
inline constexpr std::string_view kBatchPath   = "objects/batch";
inline constexpr std::string_view kMediaType   = "application/vnd.git-lfs+json";

// Pointer file format
inline constexpr std::string_view kPointerVersion = "https://git-lfs.github.com/spec/v1";
inline constexpr std::string_view kVersionPrefix  = "version ";
inline constexpr std::string_view kOidPrefix      = "oid sha256:";
inline constexpr std::string_view kSizePrefix     = "size ";
inline constexpr std::size_t kMaxPointerSize      = 1024;

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kLF    = '\n';

} // namespace lfly::consts
