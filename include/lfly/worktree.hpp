#pragma once
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lfly {

class ObjectStore;

// One object a command wants moved: oid, size and a display name.
struct ObjectRef {
  std::string oid;
  std::int64_t size = 0;
  std::string name;
};

// A finite sequence of refs that can be read again from the start.
class ObjectRefSource {
public:
  virtual ~ObjectRefSource() = default;
  // nullopt at the end
  virtual auto next() -> std::optional<ObjectRef> = 0;
  virtual void reset() = 0;
};

// Pointer files in a working tree, scanned on first use.
class WorktreeRefs : public ObjectRefSource {
public:
  explicit WorktreeRefs(std::filesystem::path root) : root_(std::move(root)) {}

  auto next() -> std::optional<ObjectRef> override;
  void reset() override;

private:
  std::filesystem::path root_;
  std::optional<std::vector<ObjectRef>> refs_;
  std::size_t pos_{0};
};

// "<oid> <size> <name>" per line; blank lines and '#' comments skipped.
// The stream must be seekable for reset().
class LineRefReader : public ObjectRefSource {
public:
  explicit LineRefReader(std::istream &in) : in_{in} {}

  // Throws std::runtime_error on a malformed line.
  auto next() -> std::optional<ObjectRef> override;
  void reset() override;

private:
  std::istream &in_;
  int line_no_{0};
};

// Drain a source into a vector.
auto collect_refs(ObjectRefSource &src) -> std::vector<ObjectRef>;

namespace worktree {

// Regular files under root as root-relative paths, skipping .lfly and .git
void enumerate_paths(const std::filesystem::path &root, std::set<std::string> &out_paths);

// Every pointer file under root; name is the relative path.
auto scan_pointers(const std::filesystem::path &root) -> std::vector<ObjectRef>;

struct CheckoutResult {
  std::vector<std::string> written;
  std::vector<std::string> missing; // pointers whose object is not in the store
};

// Replace pointer files with their stored content.
auto checkout(const std::filesystem::path &root, const ObjectStore &store) -> CheckoutResult;

} // namespace worktree

} // namespace lfly
