#include "allocator.hpp"
#include "menu.hpp"
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char *argv[]) {
  try {
    size_t total_memory = DEFAULT_TOTAL_MEMORY;
    if (argc > 1) {
      total_memory = parse_total_memory(argv[1]);
    }

    BuddyAllocator allocator(total_memory);
    run_menu(allocator, std::cin, std::cout);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
