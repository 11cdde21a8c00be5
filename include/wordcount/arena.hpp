#pragma once

// wordcount/arena.hpp — Guest-owned buffers handed across the host boundary.
//
// OWNERSHIP CONTRACT:
//   - arena_allocate() returns memory the guest owns until arena_release() is
//     called with the same address AND the same size.
//   - The host writes request bytes into, and reads response bytes out of,
//     addresses it received from arena_allocate(). The guest never
//     dereferences host-owned pointers.
//   - There is no registry of live buffers. Each block carries a hidden
//     ownership tag (magic + length) immediately before the address handed
//     out, which is how mismatched sizes and foreign addresses are refused.
//   - Releasing the same address twice is undefined behavior. The header of
//     a released block is gone, so double release is the caller's to avoid.
//
// FAILURE MODEL:
//   - Exhaustion is fatal: the guest has no fallback allocator, so
//     arena_allocate() aborts instead of returning null.
//   - A refused release leaves the block untouched (leaked rather than
//     corrupted) and is reported through log_warning().

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wordcount {

enum class ReleaseStatus {
  released,
  null_address,    // no-op
  not_owned,       // tag missing: address did not come from arena_allocate()
  size_mismatch,   // tag present, length differs from the allocation
};

std::string to_string(ReleaseStatus status);

// Reserve size bytes (uninitialized). Zero-size requests return a valid,
// unique address. Never returns nullptr.
std::uint8_t* arena_allocate(std::size_t size);

// Reclaim a block. address must come from arena_allocate() with this size.
ReleaseStatus arena_release(std::uint8_t* address, std::size_t size);

// Copy payload into a caller-supplied buffer, writing at most capacity bytes.
// Returns payload.size() (the true length) so callers can detect truncation
// as result > capacity. A null out is treated as capacity 0.
std::size_t copy_truncated(std::string_view payload, std::uint8_t* out, std::size_t capacity);

// RAII owner for one arena block inside guest code. Move-only.
class OwnedBuffer {
 public:
  OwnedBuffer() = default;
  explicit OwnedBuffer(std::size_t size);
  ~OwnedBuffer();

  OwnedBuffer(const OwnedBuffer&) = delete;
  OwnedBuffer& operator=(const OwnedBuffer&) = delete;
  OwnedBuffer(OwnedBuffer&& other) noexcept;
  OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;

  // Take back ownership of a block previously handed to the host.
  static OwnedBuffer adopt(std::uint8_t* address, std::size_t size);

  std::uint8_t* data() const { return data_; }
  std::size_t size() const { return size_; }
  bool empty() const { return data_ == nullptr; }

  // Hand the address to the host. The buffer no longer releases it.
  std::uint8_t* into_raw();

 private:
  OwnedBuffer(std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
  void reset();

  std::uint8_t* data_{nullptr};
  std::size_t size_{0};
};

}  // namespace wordcount
