#include "menu.hpp"
#include "memory_display.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    void print_options(std::ostream& out) {
        out << "\nChoose an option:\n"
            << "1. Allocate Memory\n"
            << "2. Free Memory\n"
            << "3. Print Memory State\n"
            << "4. Display Blocks by Size\n"
            << "5. Exit\n";
    }

    // Throws std::invalid_argument unless only whitespace follows `pos`
    void require_fully_parsed(const std::string& text, size_t pos) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos != text.size()) {
            throw std::invalid_argument("not an integer: " + text);
        }
    }

    // Returns false at end of input
    bool read_integer(std::istream& in, std::ostream& out, const char* prompt, long long& value) {
        out << prompt;
        std::string line;
        if (!std::getline(in, line)) {
            return false;
        }

        size_t pos = 0;
        value = std::stoll(line, &pos);
        require_fully_parsed(line, pos);
        return true;
    }

    // Sizes and addresses must not be negative
    bool read_number(std::istream& in, std::ostream& out, const char* prompt, size_t& value) {
        long long parsed;
        if (!read_integer(in, out, prompt, parsed)) {
            return false;
        }
        if (parsed < 0) {
            throw std::invalid_argument("negative value: " + std::to_string(parsed));
        }

        value = static_cast<size_t>(parsed);
        return true;
    }
}

size_t parse_total_memory(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }

    try {
        if (first == text.size() || text[first] == '-') {
            throw std::invalid_argument(text);
        }
        size_t pos = 0;
        size_t value = std::stoull(text, &pos);
        require_fully_parsed(text, pos);
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid total memory size: " + text);
    }
}

MenuAction allocate_command(BuddyAllocator& alloc, std::istream& in, std::ostream& out) {
    size_t size;
    if (!read_number(in, out, "Enter memory size to allocate (in KB): ", size)) {
        return MenuAction::Exit;
    }

    try {
        size_t address = alloc.allocate(size);
        out << "Allocated block of size: " << BuddyAllocator::next_power_of_two(size)
            << "KB at address " << address << "KB.\n";
    } catch (const AllocatorError& e) {
        out << "Error: " << e.what() << "\n";
    }
    return MenuAction::Continue;
}

MenuAction free_command(BuddyAllocator& alloc, std::istream& in, std::ostream& out) {
    size_t address;
    size_t size;
    if (!read_number(in, out, "Enter memory address to free: ", address) ||
        !read_number(in, out, "Enter memory size to free (in KB): ", size)) {
        return MenuAction::Exit;
    }

    try {
        alloc.free(address, size);
        out << "Freed " << size << "KB from address " << address << "KB.\n";
    } catch (const AllocatorError& e) {
        out << "Error: " << e.what() << "\n";
    }
    return MenuAction::Continue;
}

MenuAction run_command(BuddyAllocator& alloc, long long choice, std::istream& in,
                       std::ostream& out) {
    switch (choice) {
    case 1:
        return allocate_command(alloc, in, out);
    case 2:
        return free_command(alloc, in, out);
    case 3:
        out << "\n";
        print_memory_state(out, alloc);
        return MenuAction::Continue;
    case 4:
        print_blocks_by_size(out, alloc,
                             std::vector<size_t>(BREAKDOWN_SIZES.begin(), BREAKDOWN_SIZES.end()));
        return MenuAction::Continue;
    case 5:
        out << "Exiting...\n";
        return MenuAction::Exit;
    default:
        out << "Invalid choice. Please enter a number between 1 and 5.\n";
        return MenuAction::Continue;
    }
}

void run_menu(BuddyAllocator& alloc, std::istream& in, std::ostream& out) {
    MenuAction action = MenuAction::Continue;
    while (action == MenuAction::Continue) {
        print_options(out);
        try {
            long long choice;
            if (!read_integer(in, out, "Enter your choice: ", choice)) {
                return;
            }
            action = run_command(alloc, choice, in, out);
        } catch (const std::invalid_argument&) {
            out << "Invalid input. Please enter a number.\n";
        } catch (const std::out_of_range&) {
            out << "Invalid input. Please enter a number.\n";
        }
    }
}
