#include "lfly/transferable.hpp"

#include "lfly/consts.hpp"
#include "lfly/errors.hpp"
#include "lfly/object_store.hpp"

#include <system_error>

namespace lfly {

std::string_view transfer_kind(Direction dir) {
  return dir == Direction::Download ? consts::kDownload : consts::kUpload;
}

std::shared_ptr<Uploadable> Uploadable::create(const ObjectStore &store, const std::string &oid,
                                               const std::string &name) {
  auto p = store.path_for_read_only(oid);
  std::error_code ec;
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) {
    throw store_error(oid, "error uploading file " + name + " (" + oid + "): " + ec.message());
  }
  return std::shared_ptr<Uploadable>(
      new Uploadable(oid, static_cast<std::int64_t>(size), name, std::move(p)));
}

std::shared_ptr<Downloadable> Downloadable::create(const ObjectStore &store, const std::string &oid,
                                                   std::int64_t size, const std::string &name) {
  return std::shared_ptr<Downloadable>(
      new Downloadable(oid, size, name, store.path_for_read_only(oid)));
}

} // namespace lfly
