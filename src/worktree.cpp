#include "lfly/worktree.hpp"

#include "lfly/consts.hpp"
#include "lfly/fs.hpp"
#include "lfly/hash.hpp"
#include "lfly/object_store.hpp"
#include "lfly/pointer.hpp"
#include "lfly/trace.hpp"

#include <charconv>
#include <istream>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace lfly {

std::optional<ObjectRef> WorktreeRefs::next() {
  if (!refs_) {
    refs_ = worktree::scan_pointers(root_);
    pos_ = 0;
  }
  if (pos_ >= refs_->size()) {
    return std::nullopt;
  }
  return (*refs_)[pos_++];
}

void WorktreeRefs::reset() {
  refs_.reset();
  pos_ = 0;
}

std::optional<ObjectRef> LineRefReader::next() {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_no_;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto sp1 = line.find(consts::kSpace);
    const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(consts::kSpace, sp1 + 1);
    if (sp1 == std::string::npos) {
      throw std::runtime_error("line " + std::to_string(line_no_) + ": expected '<oid> <size> [name]'");
    }
    ObjectRef ref;
    ref.oid = line.substr(0, sp1);
    if (!looks_oid(ref.oid)) {
      throw std::runtime_error("line " + std::to_string(line_no_) + ": invalid oid '" + ref.oid + "'");
    }
    const std::string size_s =
        line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    auto [p, ec] = std::from_chars(size_s.data(), size_s.data() + size_s.size(), ref.size);
    if (ec != std::errc{} || p != size_s.data() + size_s.size() || ref.size < 0) {
      throw std::runtime_error("line " + std::to_string(line_no_) + ": invalid size '" + size_s + "'");
    }
    ref.name = sp2 == std::string::npos ? ref.oid : line.substr(sp2 + 1);
    return ref;
  }
  if (in_.bad()) {
    throw std::runtime_error("read error in object list");
  }
  return std::nullopt;
}

void LineRefReader::reset() {
  in_.clear();
  in_.seekg(0);
  if (!in_) {
    throw std::runtime_error("object list is not seekable");
  }
  line_no_ = 0;
}

std::vector<ObjectRef> collect_refs(ObjectRefSource &src) {
  std::vector<ObjectRef> out;
  while (auto r = src.next()) {
    out.push_back(std::move(*r));
  }
  return out;
}

namespace worktree {

void enumerate_paths(const stdfs::path &root, std::set<std::string> &out_paths) {
  for (auto it = stdfs::recursive_directory_iterator(root);
       it != stdfs::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (p.filename() == consts::kStateDir || p.filename() == ".git") {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out_paths.insert(stdfs::relative(p, root).generic_string());
  }
}

std::vector<ObjectRef> scan_pointers(const stdfs::path &root) {
  std::set<std::string> paths;
  enumerate_paths(root, paths);
  std::vector<ObjectRef> refs;
  for (const auto &rel : paths) {
    if (auto ptr = read_pointer_file(root / rel)) {
      refs.push_back(ObjectRef{ptr->oid, ptr->size, rel});
    }
  }
  return refs;
}

CheckoutResult checkout(const stdfs::path &root, const ObjectStore &store) {
  CheckoutResult res;
  for (const auto &ref : scan_pointers(root)) {
    if (!store.exists(ref.oid, ref.size)) {
      res.missing.push_back(ref.name);
      continue;
    }
    const auto dest = root / ref.name;
    const auto tmp = stdfs::path(dest.string() + ".lfly-" + fs::random_hex(8));
    std::error_code ec;
    stdfs::copy_file(store.path_for_read_only(ref.oid), tmp, ec);
    if (!ec) {
      const auto perms = stdfs::status(dest, ec).permissions();
      if (!ec) {
        stdfs::permissions(tmp, perms, ec);
      }
    }
    if (!ec) {
      stdfs::rename(tmp, dest, ec);
    }
    if (ec) {
      std::error_code ignored;
      stdfs::remove(tmp, ignored);
      throw std::runtime_error("checkout " + ref.name + ": " + ec.message());
    }
    trace("checkout: ", ref.name, " <- ", ref.oid);
    res.written.push_back(ref.name);
  }
  return res;
}

} // namespace worktree

} // namespace lfly
