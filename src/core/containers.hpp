#pragma once

#include <ankerl/unordered_dense.h>

namespace harbor::core {

// Dense open-addressing containers (ankerl::unordered_dense).
// Iterators and references are invalidated on insertion, like std::vector,
// so never hold a pointer into one of these across an insert.
//
// Usage:
//   harbor::core::fast_map<std::string, std::shared_ptr<TokenBucket>> buckets;
//   harbor::core::fast_set<const UpstreamServer*> excluded;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace harbor::core
