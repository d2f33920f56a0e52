#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace graft {

using blake3_t = std::array<unsigned char, 32>;

// Incremental hasher. Variable-length fields are length-prefixed so that
// adjacent fields cannot alias ("ab","c" vs "a","bc").
class blake3_builder {
 public:
  blake3_builder();
  ~blake3_builder();
  blake3_builder(blake3_builder const &) = delete;
  blake3_builder &operator=(blake3_builder const &) = delete;

  blake3_builder &update(std::string_view field);
  blake3_builder &update(std::uint64_t value);

  blake3_t finalize() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace graft
