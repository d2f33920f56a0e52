#include "blake3_util.h"

#include "blake3.h"

namespace graft {

struct blake3_builder::impl {
  blake3_hasher hasher;
};

blake3_builder::blake3_builder() : m{ std::make_unique<impl>() } {
  blake3_hasher_init(&m->hasher);
}

blake3_builder::~blake3_builder() = default;

blake3_builder &blake3_builder::update(std::uint64_t value) {
  unsigned char bytes[8];
  for (int i{ 0 }; i < 8; ++i) {  // little-endian regardless of host
    bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xffu);
  }
  blake3_hasher_update(&m->hasher, bytes, sizeof bytes);
  return *this;
}

blake3_builder &blake3_builder::update(std::string_view field) {
  update(static_cast<std::uint64_t>(field.size()));
  blake3_hasher_update(&m->hasher, field.data(), field.size());
  return *this;
}

blake3_t blake3_builder::finalize() const {
  blake3_t digest;
  blake3_hasher_finalize(&m->hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace graft
