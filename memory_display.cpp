#include "memory_display.hpp"
#include <algorithm>

namespace {
    const char* UNIT = "KB";

    // Free buckets come back ascending; both views list the largest first
    std::vector<BuddyAllocator::FreeBucket> free_buckets_descending(const BuddyAllocator& alloc) {
        auto buckets = alloc.free_list();
        std::reverse(buckets.begin(), buckets.end());
        return buckets;
    }
}

void print_memory_state(std::ostream& os, const BuddyAllocator& alloc) {
    os << "Total Memory: " << alloc.get_total_space() << UNIT << "\n"
       << "Allocated Memory: " << alloc.get_allocated_space() << UNIT << "\n"
       << "Free Memory: " << alloc.get_free_space() << UNIT << "\n"
       << "Free Blocks:\n";

    for (const auto& bucket : free_buckets_descending(alloc)) {
        for (size_t i = 0; i < bucket.addresses.size(); ++i) {
            os << "Block Size: " << bucket.size << UNIT << ", Allocated: false\n";
        }
    }

    for (const auto& pair : alloc.allocated_blocks()) {
        os << "Block Size: " << pair.second << UNIT << ", Allocated: true\n";
    }
}

void print_memory_details(std::ostream& os, const BuddyAllocator& alloc) {
    os << "\nMemory Details:\n"
       << "Total Memory: " << alloc.get_total_space() << UNIT << "\n"
       << "Allocated Memory:\n";

    auto allocated = alloc.allocated_blocks();
    if (allocated.empty()) {
        os << "  No allocated memory blocks.\n";
    }
    for (const auto& pair : allocated) {
        os << "  Address: " << pair.first << UNIT << ", Block Size: " << pair.second << UNIT
           << ", Allocated: True\n";
    }

    os << "Free Blocks:\n";
    for (const auto& bucket : free_buckets_descending(alloc)) {
        for (size_t address : bucket.addresses) {
            os << "  Address: " << address << UNIT << ", Block Size: " << bucket.size << UNIT
               << ", Allocated: False\n";
        }
    }
}

void print_blocks_by_size(std::ostream& os, const BuddyAllocator& alloc,
                          const std::vector<size_t>& sizes) {
    os << "\nBlocks by Size:\n";
    for (size_t size : sizes) {
        os << "Block Size: " << size << UNIT << "\n";
        for (size_t address : alloc.allocated_blocks(size)) {
            os << "  Address: " << address << UNIT << ", Allocated: True\n";
        }
        for (size_t address : alloc.free_blocks(size)) {
            os << "  Address: " << address << UNIT << ", Allocated: False\n";
        }
    }
}
