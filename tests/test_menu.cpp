#include "menu.hpp"
#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::Contains;

namespace {

const std::string OPTIONS = "\nChoose an option:\n"
                            "1. Allocate Memory\n"
                            "2. Free Memory\n"
                            "3. Print Memory State\n"
                            "4. Display Blocks by Size\n"
                            "5. Exit\n"
                            "Enter your choice: ";

std::string run_session(BuddyAllocator& alloc, const std::string& input)
{
    std::istringstream in(input);
    std::ostringstream out;
    run_menu(alloc, in, out);
    return out.str();
}

} // namespace

TEST_CASE("Menu: Allocate then exit", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);
    std::string out = run_session(alloc, "1\n200\n5\n");

    REQUIRE(out == OPTIONS + "Enter memory size to allocate (in KB): " +
                       "Allocated block of size: 256KB at address 0KB.\n" + OPTIONS +
                       "Exiting...\n");
    REQUIRE(alloc.allocated_blocks().size() == 1);
}

TEST_CASE("Menu: Free coalesces through the menu", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);
    std::string out = run_session(alloc, "1\n200\n1\n100\n2\n0\n200\n2\n256\n128\n5\n");

    REQUIRE_THAT(out, Contains("Allocated block of size: 128KB at address 256KB."));
    REQUIRE_THAT(out, Contains("Enter memory address to free: Enter memory size to free (in KB): "
                               "Freed 200KB from address 0KB."));
    REQUIRE_THAT(out, Contains("Freed 128KB from address 256KB."));
    REQUIRE(alloc.allocated_blocks().empty());
    REQUIRE(alloc.free_blocks(1024) == std::vector<size_t>{0});
}

TEST_CASE("Menu: Allocator errors keep the loop running", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);

    SECTION("Oversized allocation")
    {
        std::string out = run_session(alloc, "1\n2000\n5\n");
        REQUIRE_THAT(out, Contains("Error: Requested size exceeds total memory.\n" + OPTIONS));
        REQUIRE_THAT(out, Contains("Exiting..."));
    }

    SECTION("Exhaustion")
    {
        std::string out = run_session(alloc, "1\n1024\n1\n1\n5\n");
        REQUIRE_THAT(out, Contains("Error: No suitable block available for allocation."));
    }

    SECTION("Mismatched free")
    {
        std::string out = run_session(alloc, "1\n64\n2\n0\n128\n5\n");
        REQUIRE_THAT(out, Contains("Error: Invalid free operation. Address and size do not match."));
        REQUIRE(alloc.allocated_blocks().size() == 1);
    }

    SECTION("Oversized free")
    {
        std::string out = run_session(alloc, "2\n0\n4096\n5\n");
        REQUIRE_THAT(out, Contains("Error: Block size exceeds total memory."));
    }
}

TEST_CASE("Menu: Bad input", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);

    SECTION("Non-numeric choice")
    {
        std::string out = run_session(alloc, "abc\n5\n");
        REQUIRE(out == OPTIONS + "Invalid input. Please enter a number.\n" + OPTIONS +
                           "Exiting...\n");
    }

    SECTION("Trailing garbage and negative numbers")
    {
        std::string out = run_session(alloc, "3x\n1\n-4\n5\n");
        REQUIRE(out == OPTIONS + "Invalid input. Please enter a number.\n" + OPTIONS +
                           "Enter memory size to allocate (in KB): " +
                           "Invalid input. Please enter a number.\n" + OPTIONS + "Exiting...\n");
        REQUIRE(alloc.allocated_blocks().empty());
    }

    SECTION("Out of range choice")
    {
        std::string out = run_session(alloc, "9\n0\n5\n");
        REQUIRE(out == OPTIONS + "Invalid choice. Please enter a number between 1 and 5.\n" +
                           OPTIONS + "Invalid choice. Please enter a number between 1 and 5.\n" +
                           OPTIONS + "Exiting...\n");
    }

    SECTION("Number too large to parse")
    {
        std::string out = run_session(alloc, "99999999999999999999999\n5\n");
        REQUIRE_THAT(out, Contains("Invalid input. Please enter a number."));
    }
}

TEST_CASE("Menu: End of input stops the loop", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);

    REQUIRE(run_session(alloc, "") == OPTIONS);
    REQUIRE(run_session(alloc, "1\n") == OPTIONS + "Enter memory size to allocate (in KB): ");
    REQUIRE(run_session(alloc, "2\n0\n") ==
            OPTIONS + "Enter memory address to free: Enter memory size to free (in KB): ");
    REQUIRE(alloc.allocated_blocks().empty());
}

TEST_CASE("Menu: State views", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);
    alloc.allocate(512);

    std::string out = run_session(alloc, "3\n4\n5\n");
    REQUIRE_THAT(out, Contains("\nTotal Memory: 1024KB\n"
                               "Allocated Memory: 512KB\n"
                               "Free Memory: 512KB\n"));
    REQUIRE_THAT(out, Contains("\nBlocks by Size:\n"
                               "Block Size: 512KB\n"
                               "  Address: 0KB, Allocated: True\n"
                               "  Address: 512KB, Allocated: False\n"
                               "Block Size: 256KB\n"
                               "Block Size: 128KB\n"));
}

TEST_CASE("Menu: Commands work on the allocator they are given", "[menu]")
{
    BuddyAllocator first(DEFAULT_TOTAL_MEMORY);
    BuddyAllocator second(DEFAULT_TOTAL_MEMORY);
    std::istringstream in("256\n");
    std::ostringstream out;

    REQUIRE(run_command(second, 1, in, out) == MenuAction::Continue);
    REQUIRE(first.allocated_blocks().empty());
    REQUIRE(second.allocated_blocks().size() == 1);

    std::istringstream none;
    REQUIRE(run_command(first, 5, none, out) == MenuAction::Exit);
}

TEST_CASE("Menu: Negative choice is an invalid choice", "[menu]")
{
    BuddyAllocator alloc(DEFAULT_TOTAL_MEMORY);

    std::string out = run_session(alloc, "-1\n5\n");
    REQUIRE(out == OPTIONS + "Invalid choice. Please enter a number between 1 and 5.\n" + OPTIONS +
                       "Exiting...\n");
}

TEST_CASE("Menu: Total memory argument", "[menu][config]")
{
    SECTION("Whole non-negative integers are accepted")
    {
        REQUIRE(parse_total_memory("1024") == 1024);
        REQUIRE(parse_total_memory(" 64 ") == 64);
        REQUIRE(parse_total_memory("9223372036854775808") == (size_t(1) << 63));
    }

    SECTION("Anything else is rejected with a readable message")
    {
        for (const char* text : {"1024abc", "64.9", "-9223372036854775808", "-1", "abc", "",
                                 "99999999999999999999999"}) {
            try {
                parse_total_memory(text);
                FAIL("accepted " << text);
            } catch (const std::invalid_argument& e) {
                REQUIRE(std::string(e.what()) == std::string("Invalid total memory size: ") + text);
            }
        }
    }

    SECTION("Parsed value still has to be a power of two")
    {
        REQUIRE_THROWS_AS(BuddyAllocator(parse_total_memory("1000")), AllocatorError);
    }
}
