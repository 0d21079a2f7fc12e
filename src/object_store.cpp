#include "lfly/object_store.hpp"

#include "lfly/consts.hpp"
#include "lfly/errors.hpp"
#include "lfly/fs.hpp"
#include "lfly/trace.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace {

std::string errno_text(int err) { return std::generic_category().message(err); }

void write_all(int fd, const std::uint8_t *p, std::size_t n, const stdfs::path &where) {
  while (n != 0U) {
    const ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw lfly::store_error({}, "write " + where.string() + ": " + errno_text(errno));
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

// Pump `in` through `sink` in fixed chunks, reporting progress.
template <typename Sink>
void copy_stream(std::istream &in, std::int64_t total, const lfly::CopyCallback &cb, Sink &&sink) {
  std::vector<std::uint8_t> buf(lfly::consts::kCopyBufferSize);
  std::int64_t read = 0;
  while (in) {
    in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == 0)
      break;
    sink(std::span<const std::uint8_t>(buf.data(), got));
    read += static_cast<std::int64_t>(got);
    if (cb)
      cb(total, read, got);
  }
  if (in.bad()) {
    throw lfly::store_error({}, "read failed while copying");
  }
}

} // namespace

namespace lfly {

// ObjectWriter

ObjectWriter::ObjectWriter(const ObjectStore &store, std::string oid, std::int64_t expected_size,
                           stdfs::path tmp, UniqueFd fd)
    : store_{&store}, oid_{std::move(oid)}, expected_size_{expected_size}, tmp_{std::move(tmp)},
      fd_{std::move(fd)}, hasher_{std::make_unique<Sha256>()} {}

ObjectWriter::ObjectWriter(ObjectWriter &&other) noexcept
    : store_{other.store_}, oid_{std::move(other.oid_)}, expected_size_{other.expected_size_},
      tmp_{std::move(other.tmp_)}, fd_{std::move(other.fd_)}, hasher_{std::move(other.hasher_)},
      written_{other.written_}, done_{other.done_} {
  other.done_ = true;
}

ObjectWriter &ObjectWriter::operator=(ObjectWriter &&other) noexcept {
  if (this != &other) {
    discard();
    store_ = other.store_;
    oid_ = std::move(other.oid_);
    expected_size_ = other.expected_size_;
    tmp_ = std::move(other.tmp_);
    fd_ = std::move(other.fd_);
    hasher_ = std::move(other.hasher_);
    written_ = other.written_;
    done_ = other.done_;
    other.done_ = true;
  }
  return *this;
}

ObjectWriter::~ObjectWriter() { discard(); }

void ObjectWriter::write(std::span<const std::uint8_t> data) {
  if (done_) {
    throw std::logic_error("ObjectWriter::write after commit/discard");
  }
  write_all(fd_.get(), data.data(), data.size(), tmp_);
  hasher_->update(data);
  written_ += static_cast<std::int64_t>(data.size());
}

void ObjectWriter::discard() noexcept {
  if (done_) {
    return;
  }
  done_ = true;
  fd_.reset();
  std::error_code ec;
  stdfs::remove(tmp_, ec);
}

std::string ObjectWriter::commit() {
  if (done_) {
    throw std::logic_error("ObjectWriter::commit after commit/discard");
  }
  if (::fsync(fd_.get()) != 0 || !fd_.close()) {
    const int err = errno;
    discard();
    throw store_error(oid_, "flush " + tmp_.string() + ": " + errno_text(err));
  }

  if (expected_size_ >= 0 && written_ != expected_size_) {
    discard();
    throw size_mismatch(oid_, expected_size_, written_);
  }
  const std::string actual = hasher_->finish();
  if (!oid_.empty() && actual != oid_) {
    discard();
    throw hash_mismatch(oid_, actual);
  }

  stdfs::path dest;
  try {
    dest = store_->path_for(actual);
  } catch (const Error &) {
    discard();
    throw;
  }

  std::error_code ec;
  // keep the mode of the file being replaced
  const auto st = stdfs::status(dest, ec);
  if (!ec && stdfs::exists(st)) {
    stdfs::permissions(tmp_, st.permissions(), stdfs::perm_options::replace, ec);
    if (ec) {
      discard();
      throw store_error(actual, "can't set filemode on " + tmp_.string() + ": " + ec.message());
    }
  }

  stdfs::rename(tmp_, dest, ec);
  if (ec) {
    discard();
    throw store_error(actual, "cannot replace " + dest.string() + " with " + tmp_.string() +
                                  ": " + ec.message());
  }
  done_ = true;
  return actual;
}

// ObjectStore

ObjectStore ObjectStore::for_repo(const stdfs::path &repo_root) {
  return ObjectStore{repo_root / consts::kStateDir};
}

stdfs::path ObjectStore::objects_dir() const { return root_ / consts::kObjectsDir; }
stdfs::path ObjectStore::tmp_dir() const { return root_ / consts::kTmpDir; }
stdfs::path ObjectStore::bad_dir() const { return root_ / consts::kBadDir; }

stdfs::path ObjectStore::path_for_read_only(std::string_view oid) const {
  if (!looks_oid(oid)) {
    throw store_error(std::string(oid), "invalid oid '" + std::string(oid) + "'");
  }
  stdfs::path p = objects_dir();
  for (std::size_t level = 0; level < consts::kFanoutLevels; ++level) {
    p /= std::string(oid.substr(level * consts::kFanoutDirHexLen, consts::kFanoutDirHexLen));
  }
  return p / std::string(oid);
}

stdfs::path ObjectStore::path_for(std::string_view oid) const {
  auto p = path_for_read_only(oid);
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec) {
    throw store_error(std::string(oid), "mkdir " + p.parent_path().string() + ": " + ec.message());
  }
  return p;
}

bool ObjectStore::exists(std::string_view oid, std::int64_t size, Check check) const {
  const auto p = path_for_read_only(oid);
  std::error_code ec;
  const auto actual = stdfs::file_size(p, ec);
  if (ec) {
    return false;
  }
  if (static_cast<std::int64_t>(actual) != size) {
    trace("store: removing ", p.string(), ", size ", actual, " is invalid");
    stdfs::remove(p, ec);
    return false;
  }
  if (check == Check::Content && hash_file(p).oid != oid) {
    trace("store: removing ", p.string(), ", content does not match oid");
    stdfs::remove(p, ec);
    return false;
  }
  return true;
}

std::pair<stdfs::path, UniqueFd> ObjectStore::open_temp(std::string_view oid) const {
  std::error_code ec;
  stdfs::create_directories(tmp_dir(), ec);
  if (ec) {
    throw store_error(std::string(oid), "mkdir " + tmp_dir().string() + ": " + ec.message());
  }
  const std::string stem = oid.empty() ? std::string("ingest") : std::string(oid);
  for (int attempt = 0; attempt < 16; ++attempt) {
    auto p = tmp_dir() / (stem + "-" + fs::random_hex(12));
    const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      return {std::move(p), UniqueFd{fd}};
    }
    if (errno != EEXIST) {
      throw store_error(std::string(oid), "cannot create temp file " + p.string() + ": " +
                                              errno_text(errno));
    }
  }
  throw store_error(std::string(oid), "cannot create a unique temp file in " + tmp_dir().string());
}

ObjectWriter ObjectStore::begin_write(std::string_view oid, std::int64_t size) const {
  if (!looks_oid(oid)) {
    throw store_error(std::string(oid), "invalid oid '" + std::string(oid) + "'");
  }
  auto [tmp, fd] = open_temp(oid);
  return ObjectWriter{*this, std::string(oid), size, std::move(tmp), std::move(fd)};
}

void ObjectStore::write_verified(std::string_view oid, std::istream &in, std::int64_t size,
                                 const CopyCallback &cb) const {
  auto w = begin_write(oid, size);
  copy_stream(in, size, cb, [&](std::span<const std::uint8_t> chunk) { w.write(chunk); });
  (void)w.commit();
}

IngestResult ObjectStore::ingest(std::istream &in, const CopyCallback &cb) const {
  return ingest({}, in, cb);
}

IngestResult ObjectStore::ingest(std::span<const std::uint8_t> prefix, std::istream &rest,
                                 const CopyCallback &cb) const {
  auto [tmp, fd] = open_temp({});
  ObjectWriter w{*this, {}, -1, std::move(tmp), std::move(fd)};
  const auto head = static_cast<std::int64_t>(prefix.size());
  if (!prefix.empty()) {
    w.write(prefix);
    if (cb)
      cb(-1, head, prefix.size());
  }
  copy_stream(rest, -1, {}, [&](std::span<const std::uint8_t> chunk) {
    w.write(chunk);
    if (cb)
      cb(-1, w.written(), chunk.size());
  });
  const auto size = w.written();
  return IngestResult{.oid = w.commit(), .size = size};
}

VerifyStatus ObjectStore::verify(std::string_view oid) const {
  const auto p = path_for_read_only(oid);
  if (!fs::exists(p)) {
    return VerifyStatus::Missing;
  }
  return hash_file(p).oid == oid ? VerifyStatus::Ok : VerifyStatus::Corrupt;
}

stdfs::path ObjectStore::quarantine(std::string_view oid) const {
  const auto from = path_for_read_only(oid);
  std::error_code ec;
  stdfs::create_directories(bad_dir(), ec);
  if (ec) {
    throw store_error(std::string(oid), "mkdir " + bad_dir().string() + ": " + ec.message());
  }
  auto to = bad_dir() / std::string(oid);
  stdfs::rename(from, to, ec);
  if (ec) {
    throw store_error(std::string(oid), "cannot move " + from.string() + " to " + to.string() +
                                            ": " + ec.message());
  }
  return to;
}

std::vector<std::string> ObjectStore::list() const {
  std::vector<std::string> out;
  std::error_code ec;
  if (!stdfs::is_directory(objects_dir(), ec)) {
    return out;
  }
  for (stdfs::recursive_directory_iterator it(objects_dir(), ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file())
      continue;
    auto name = it->path().filename().string();
    if (looks_oid(name))
      out.push_back(std::move(name));
  }
  std::ranges::sort(out);
  return out;
}

IngestResult ObjectStore::hash_file(const stdfs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw store_error({}, "open for read failed: " + p.string());
  }
  Sha256 h;
  std::int64_t size = 0;
  copy_stream(ifs, -1, {}, [&](std::span<const std::uint8_t> chunk) {
    h.update(chunk);
    size += static_cast<std::int64_t>(chunk.size());
  });
  return IngestResult{.oid = h.finish(), .size = size};
}

} // namespace lfly
