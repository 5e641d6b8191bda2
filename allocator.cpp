#include "allocator.hpp"

namespace {
size_t checked_order_count(size_t total_memory) {
  if (!BuddyAllocator::is_power_of_2(total_memory)) {
    throw AllocatorError(AllocatorErrorKind::NotPowerOfTwo,
                         "Total memory size must be a power of 2.");
  }
  return __builtin_ctzll(total_memory) + 1;
}
} // namespace

size_t FreeListRegistry::pop_lowest(size_t order) {
  auto &bucket = buckets[order];
  size_t address = *bucket.begin();
  bucket.erase(bucket.begin());
  return address;
}

BuddyAllocator::BuddyAllocator(size_t total_memory)
    : total_size(total_memory), allocated_size(0),
      free_blocks_by_order(checked_order_count(total_memory)) {
  free_blocks_by_order.insert(order_of(total_size), 0);
}

size_t BuddyAllocator::allocate(size_t size) {
  // Compare before rounding so huge requests cannot overflow
  if (size > total_size) {
    throw AllocatorError(AllocatorErrorKind::RequestTooLarge,
                         "Requested size exceeds total memory.");
  }

  size_t block_size = next_power_of_two(size);
  size_t wanted = order_of(block_size);

  // Smallest non-empty bucket that fits
  size_t order = wanted;
  while (order < free_blocks_by_order.order_count() &&
         free_blocks_by_order.empty(order)) {
    ++order;
  }
  if (order == free_blocks_by_order.order_count()) {
    throw AllocatorError(AllocatorErrorKind::NoSuitableBlock,
                         "No suitable block available for allocation.");
  }

  size_t addr = free_blocks_by_order.pop_lowest(order);

  // Split only if necessary, keeping the low half
  while (order > wanted) {
    --order;
    free_blocks_by_order.insert(order, addr + (size_t(1) << order));
  }

  allocated_by_address.insert(addr, block_size);
  allocated_size += block_size;
  return addr;
}

void BuddyAllocator::free(size_t address, size_t size) {
  if (size > total_size) {
    throw AllocatorError(AllocatorErrorKind::RequestTooLarge,
                         "Block size exceeds total memory.");
  }

  size_t block_size = next_power_of_two(size);
  if (allocated_by_address.size_at(address) != block_size) {
    throw AllocatorError(
        AllocatorErrorKind::InvalidFree,
        "Invalid free operation. Address and size do not match.");
  }

  allocated_by_address.erase(address);
  allocated_size -= block_size;

  // Merge buddies if possible
  size_t order = order_of(block_size);
  while (block_size < total_size) {
    size_t buddy_addr = address ^ block_size;
    if (!free_blocks_by_order.erase(order, buddy_addr))
      break;

    if (buddy_addr < address)
      address = buddy_addr;
    block_size <<= 1;
    ++order;
  }

  free_blocks_by_order.insert(order, address);
}

std::vector<std::pair<size_t, size_t>>
BuddyAllocator::allocated_blocks() const {
  const auto &entries = allocated_by_address.entries();
  return {entries.begin(), entries.end()};
}

std::vector<size_t> BuddyAllocator::allocated_blocks(size_t size) const {
  std::vector<size_t> addresses;
  for (const auto &pair : allocated_by_address.entries()) {
    if (pair.second == size)
      addresses.push_back(pair.first);
  }
  return addresses;
}

std::vector<BuddyAllocator::FreeBucket> BuddyAllocator::free_list() const {
  std::vector<FreeBucket> buckets;
  for (size_t order = 0; order < free_blocks_by_order.order_count(); ++order) {
    const auto &bucket = free_blocks_by_order.bucket(order);
    if (bucket.empty())
      continue;
    buckets.push_back(
        {size_t(1) << order, std::vector<size_t>(bucket.begin(), bucket.end())});
  }
  return buckets;
}

std::vector<size_t> BuddyAllocator::free_blocks(size_t size) const {
  if (!is_power_of_2(size) || size > total_size)
    return {};
  const auto &bucket = free_blocks_by_order.bucket(order_of(size));
  return {bucket.begin(), bucket.end()};
}

BuddyAllocator::Snapshot BuddyAllocator::snapshot() const {
  return {total_size, allocated_blocks(), free_list()};
}
