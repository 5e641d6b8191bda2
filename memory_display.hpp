#pragma once
#include "allocator.hpp"
#include <ostream>
#include <vector>

// Summary view: totals, then every free and allocated block by size
void print_memory_state(std::ostream& os, const BuddyAllocator& alloc);

// Detailed view with addresses
void print_memory_details(std::ostream& os, const BuddyAllocator& alloc);

// Allocated and free blocks for each of the given sizes
void print_blocks_by_size(std::ostream& os, const BuddyAllocator& alloc,
                          const std::vector<size_t>& sizes);
