#pragma once

#include "navcache/storage.hpp"
#include "navcache/types.hpp"

#include <string>

namespace navcache {

// Little-endian binary records stored by the durable tier. Each blob starts
// with a four byte magic and a format version.
Blob encode_entry(const CacheEntry &entry);
bool decode_entry(const Blob &blob, CacheEntry *out,
                  std::string *err = nullptr);

Blob encode_state(const PageState &state);
bool decode_state(const Blob &blob, PageState *out,
                  std::string *err = nullptr);

} // namespace navcache
