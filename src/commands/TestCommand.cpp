/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for system self-testing.
 *
 * Checks platform assumptions needed for large files and runs the line
 * extractor over a few in-memory samples, comparing the reverse path (tiny
 * chunks) against the forward splitter.
 */

#include "TestCommand.hpp"
#include "core/LastLines.hpp"
#include "io/MemorySource.hpp"

REGISTER_COMMAND(TestCommand);

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

static bool check_sample(const std::string& sample, int line_count) {
    std::vector<std::string> expected = ListFile::split_lines(sample);
    if( expected.size() > (size_t)line_count ){
        expected.erase(expected.begin(), expected.end() - line_count);
    }

    for( size_t chunk_size : {1, 2, 3, 5, 4096} ){
        MemorySource src(sample);
        std::vector<std::string> lines = ListFile::get_last_lines(src, line_count, chunk_size);
        if( lines != expected ){
            logger->critical("selftest: sample of {} bytes, n={} chunk={}: got {} lines, expected {}",
                sample.size(), line_count, chunk_size, lines.size(), expected.size());
            return false;
        }
    }
    return true;
}

/**
 * @brief Executes self-tests.
 *
 * - off_t must be 8 bytes, otherwise files over 2Gb can't be addressed
 * - size_t must be 8 bytes
 * - extraction must give identical results for any chunk size
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    logger->trace("selftest: sizeof(off_t)     = {}", sizeof(off_t));
    logger->trace("selftest: sizeof(size_t)    = {}", sizeof(size_t));

    if( sizeof(off_t) != 8 ){
        logger->critical("selftest: sizeof(off_t) != 8");
        return 1;
    }

    if( sizeof(size_t) != 8 ){
        logger->critical("selftest: sizeof(size_t) != 8");
        return 1;
    }

    static const char* samples[] = {
        "",
        "single",
        "a\nb\nc\n",
        "a\r\nb\r\nc",
        "a\rb\r\n\r\nc\n\n",
        "\n\nx\n",
    };
    for( const char* sample : samples ){
        for( int n : {1, 2, 10} ){
            if( !check_sample(sample, n) ){
                return 1;
            }
        }
    }

    logger->trace("selftest: OK");
    return 0;
}
