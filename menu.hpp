#pragma once
#include "allocator.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

constexpr size_t DEFAULT_TOTAL_MEMORY = 1024;
constexpr std::array<size_t, 3> BREAKDOWN_SIZES = {512, 256, 128};

enum class MenuAction { Continue, Exit };

// Each handler reads its own prompts from `in`. Allocator errors are
// reported on `out`; malformed numbers throw std::invalid_argument or
// std::out_of_range. Exit is also returned when input runs out.
MenuAction allocate_command(BuddyAllocator& alloc, std::istream& in, std::ostream& out);
MenuAction free_command(BuddyAllocator& alloc, std::istream& in, std::ostream& out);
MenuAction run_command(BuddyAllocator& alloc, long long choice, std::istream& in,
                       std::ostream& out);

// Whole-string non-negative integer for the total memory argument. Throws
// std::invalid_argument with a readable message otherwise.
size_t parse_total_memory(const std::string& text);

// Interactive loop until option 5 or end of input
void run_menu(BuddyAllocator& alloc, std::istream& in, std::ostream& out);
