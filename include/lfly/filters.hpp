#pragma once
#include "lfly/object_store.hpp"
#include "lfly/pointer.hpp"

#include <functional>
#include <iosfwd>

namespace lfly {

// Makes the object for a pointer present in the store; throws when it cannot.
using Fetcher = std::function<void(const Pointer &)>;

// Copy file content into the store and return its pointer. Input that
// already is a pointer is returned as parsed, without storing anything.
auto clean(std::istream &in, const ObjectStore &store, const CopyCallback &cb = {}) -> Pointer;

/**
 * Write the stored content for `ptr` to `out`. A missing object is
 * fetched first when `fetch` is set; without a fetcher the pointer text
 * itself is written and false is returned.
 */
auto smudge(const Pointer &ptr, const ObjectStore &store, std::ostream &out, const Fetcher &fetch,
            const CopyCallback &cb = {}) -> bool;

} // namespace lfly
