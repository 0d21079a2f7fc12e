#include "lfly/filters.hpp"

#include "lfly/consts.hpp"
#include "lfly/errors.hpp"
#include "lfly/trace.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <vector>

namespace lfly {

Pointer clean(std::istream &in, const ObjectStore &store, const CopyCallback &cb) {
  std::vector<std::uint8_t> head(consts::kMaxPointerSize + 1);
  in.read(reinterpret_cast<char *>(head.data()), static_cast<std::streamsize>(head.size()));
  if (in.bad()) {
    throw store_error({}, "read failed while cleaning");
  }
  head.resize(static_cast<std::size_t>(in.gcount()));

  if (head.size() <= consts::kMaxPointerSize) {
    const std::string_view text(reinterpret_cast<const char *>(head.data()), head.size());
    if (auto ptr = parse_pointer(text)) {
      trace("clean: input is already a pointer to ", ptr->oid);
      return *ptr;
    }
  }
  in.clear();
  const auto res = store.ingest(head, in, cb);
  return Pointer{res.oid, res.size};
}

bool smudge(const Pointer &ptr, const ObjectStore &store, std::ostream &out, const Fetcher &fetch,
            const CopyCallback &cb) {
  if (!store.exists(ptr.oid, ptr.size)) {
    if (!fetch) {
      out << encode_pointer(ptr);
      return false;
    }
    fetch(ptr);
    if (!store.exists(ptr.oid, ptr.size)) {
      throw store_error(ptr.oid, "object " + ptr.oid + " not in store after download");
    }
  }

  const auto path = store.path_for_read_only(ptr.oid);
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw store_error(ptr.oid, "open for read failed: " + path.string());
  }
  std::vector<char> buf(consts::kCopyBufferSize);
  std::int64_t copied = 0;
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = ifs.gcount();
    if (got <= 0) {
      break;
    }
    out.write(buf.data(), got);
    if (!out) {
      throw store_error(ptr.oid, "write failed while smudging");
    }
    copied += got;
    if (cb) {
      cb(ptr.size, copied, static_cast<std::size_t>(got));
    }
  }
  if (ifs.bad()) {
    throw store_error(ptr.oid, "read failed: " + path.string());
  }
  return true;
}

} // namespace lfly
