#include "wordcount/arena.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>

#include "wordcount/observability.hpp"

namespace wordcount {

namespace {

constexpr std::uint32_t kLiveTag = 0x57434C56u;  // "WCLV"

// 16 bytes keeps the user address aligned for any scalar on wasm32 and x86-64.
struct alignas(16) BlockHeader {
  std::uint32_t tag;
  std::uint32_t reserved;
  std::uint64_t size;
};
static_assert(sizeof(BlockHeader) == 16, "BlockHeader must stay 16 bytes");

BlockHeader* header_of(std::uint8_t* address) {
  return reinterpret_cast<BlockHeader*>(address - sizeof(BlockHeader));
}

[[noreturn]] void exhausted(std::size_t size) {
  log_warning("arena", "allocation of " + std::to_string(size) + " bytes failed; aborting");
  std::abort();
}

ReleaseStatus refuse(ReleaseStatus status, const std::string& detail) {
  log_warning("arena", "release refused (" + to_string(status) + "): " + detail);
  return status;
}

}  // namespace

std::string to_string(ReleaseStatus status) {
  switch (status) {
    case ReleaseStatus::released: return "released";
    case ReleaseStatus::null_address: return "null_address";
    case ReleaseStatus::not_owned: return "not_owned";
    case ReleaseStatus::size_mismatch: return "size_mismatch";
  }
  return "";
}

std::uint8_t* arena_allocate(std::size_t size) {
  if (size > std::numeric_limits<std::size_t>::max() - sizeof(BlockHeader)) exhausted(size);
  void* raw = ::operator new(sizeof(BlockHeader) + size, std::nothrow);
  if (!raw) exhausted(size);

  auto* header = static_cast<BlockHeader*>(raw);
  header->tag = kLiveTag;
  header->reserved = 0;
  header->size = static_cast<std::uint64_t>(size);
  return static_cast<std::uint8_t*>(raw) + sizeof(BlockHeader);
}

ReleaseStatus arena_release(std::uint8_t* address, std::size_t size) {
  if (!address) return ReleaseStatus::null_address;

  BlockHeader* header = header_of(address);
  if (header->tag != kLiveTag) return refuse(ReleaseStatus::not_owned, "address not owned by arena");
  if (header->size != static_cast<std::uint64_t>(size)) {
    return refuse(ReleaseStatus::size_mismatch, "size " + std::to_string(size) + " does not match allocation of " +
                                                    std::to_string(header->size) + " bytes");
  }

  ::operator delete(static_cast<void*>(header));
  return ReleaseStatus::released;
}

std::size_t copy_truncated(std::string_view payload, std::uint8_t* out, std::size_t capacity) {
  const std::size_t n = (out == nullptr) ? 0 : (payload.size() < capacity ? payload.size() : capacity);
  if (n > 0) std::memcpy(out, payload.data(), n);
  return payload.size();
}

// ---------------------------------------------------------------------------
// OwnedBuffer
// ---------------------------------------------------------------------------

OwnedBuffer::OwnedBuffer(std::size_t size) : data_(arena_allocate(size)), size_(size) {}

OwnedBuffer::~OwnedBuffer() { reset(); }

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept : data_(other.data_), size_(other.size_) {
  other.data_ = nullptr;
  other.size_ = 0;
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
  if (this != &other) {
    reset();
    data_ = other.data_;
    size_ = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

OwnedBuffer OwnedBuffer::adopt(std::uint8_t* address, std::size_t size) {
  return OwnedBuffer(address, size);
}

std::uint8_t* OwnedBuffer::into_raw() {
  std::uint8_t* out = data_;
  data_ = nullptr;
  size_ = 0;
  return out;
}

void OwnedBuffer::reset() {
  if (data_) {
    // A refusal is already logged by arena_release(); the block is left alone.
    (void)arena_release(data_, size_);
    data_ = nullptr;
    size_ = 0;
  }
}

}  // namespace wordcount
