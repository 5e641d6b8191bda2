#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class AllocatorErrorKind {
  NotPowerOfTwo,
  RequestTooLarge,
  NoSuitableBlock,
  InvalidFree,
};

class AllocatorError : public std::runtime_error {
public:
  AllocatorError(AllocatorErrorKind kind, const std::string &message)
      : std::runtime_error(message), error_kind(kind) {}

  AllocatorErrorKind kind() const { return error_kind; }

private:
  AllocatorErrorKind error_kind;
};

// Free block addresses bucketed by log2(block size). Each bucket is kept
// ordered so the lowest address is always at the front.
class FreeListRegistry {
public:
  explicit FreeListRegistry(size_t order_count) : buckets(order_count) {}

  void insert(size_t order, size_t address) { buckets[order].insert(address); }
  bool erase(size_t order, size_t address) {
    return buckets[order].erase(address) != 0;
  }
  bool empty(size_t order) const { return buckets[order].empty(); }
  size_t pop_lowest(size_t order);

  const std::set<size_t> &bucket(size_t order) const { return buckets[order]; }
  size_t order_count() const { return buckets.size(); }

private:
  std::vector<std::set<size_t>> buckets;
};

// Address -> size of every block currently handed out.
class AllocatedRegistry {
public:
  using Map = std::map<size_t, size_t>;

  void insert(size_t address, size_t size) { blocks[address] = size; }
  void erase(size_t address) { blocks.erase(address); }
  // Returns 0 when the address is not allocated.
  size_t size_at(size_t address) const {
    auto it = blocks.find(address);
    return it == blocks.end() ? 0 : it->second;
  }
  const Map &entries() const { return blocks; }

private:
  Map blocks;
};

class BuddyAllocator {

public:
  struct FreeBucket {
    size_t size;
    std::vector<size_t> addresses; // ascending
  };

  struct Snapshot {
    size_t total_memory;
    std::vector<std::pair<size_t, size_t>> allocated; // (address, size)
    std::vector<FreeBucket> free;                     // ascending by size
  };

  explicit BuddyAllocator(size_t total_memory);
  size_t allocate(size_t size);
  void free(size_t address, size_t size);

  size_t get_total_space() const { return total_size; }
  size_t get_allocated_space() const { return allocated_size; }
  size_t get_free_space() const { return total_size - allocated_size; }

  std::vector<std::pair<size_t, size_t>> allocated_blocks() const;
  std::vector<size_t> allocated_blocks(size_t size) const;
  std::vector<FreeBucket> free_list() const;
  std::vector<size_t> free_blocks(size_t size) const;
  Snapshot snapshot() const;

  // Fast bit operations for power of 2 calculations.
  // 0 rounds to 1. Sizes above 2^63 have no representable result and wrap
  // to 0; allocate() and free() reject them before rounding.
  static inline size_t next_power_of_two(size_t x) {
    if (x <= 1)
      return 1;
    x--;
    x |= x >> 1;
    x |= x >> 2;
    x |= x >> 4;
    x |= x >> 8;
    x |= x >> 16;
    x |= x >> 32;
    x++;
    return x;
  }

  static inline bool is_power_of_2(size_t x) { return x && !(x & (x - 1)); }

private:
  // Index in the free list for a power of 2 size
  static inline size_t order_of(size_t size) { return __builtin_ctzll(size); }

  size_t total_size;     // Total simulated memory size
  size_t allocated_size; // Sum of allocated block sizes
  FreeListRegistry free_blocks_by_order;
  AllocatedRegistry allocated_by_address;
};
