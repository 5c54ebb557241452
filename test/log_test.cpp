// Built into its own executable together with src/log.cpp, with TORGEN_ENABLE_LOGGING,
// TORGEN_LOG_PATH and TORGEN_MIN_LOG_PRIORITY=priority::normal defined.
#include "torgen/log.hpp"
#include "torgen/path.hpp"
#include "torgen/string_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#ifndef TORGEN_ENABLE_LOGGING
#error "log_test.cpp must be built with TORGEN_ENABLE_LOGGING"
#endif

using namespace torgen;

namespace {

std::vector<std::string> read_lines(const fs::path& p)
{
    std::ifstream in(p);
    std::vector<std::string> lines;
    std::string line;
    while(std::getline(in, line)) { lines.push_back(line); }
    return lines;
}

} // namespace

TEST(LogTest, WritesEntriesToSubsystemFiles)
{
    const fs::path dir(TORGEN_LOG_PATH);
    fs::create_directories(dir);
    // the loggers open their files in append mode on first use, so start clean
    fs::remove(dir / "metainfo-log.txt");
    fs::remove(dir / "diskIO-log.txt");

    constexpr int num_threads = 4;
    constexpr int num_entries = 100;
    std::vector<std::thread> threads;
    for(int i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([i] {
            for(int j = 0; j < num_entries; ++j)
            {
                log::log_metainfo("test", "entry " + std::to_string(i * num_entries + j));
                // below the minimum priority
                log::log_metainfo("test", "filtered", log::priority::low);
            }
        });
    }
    for(auto& t : threads) { t.join(); }
    log::log_disk_io("io", "read 5 bytes", log::priority::high);
    log::flush();

    const auto lines = read_lines(dir / "metainfo-log.txt");
    ASSERT_EQ(lines.size(), size_t(num_threads * num_entries));

    const std::string prefix = "[n|test] entry ";
    std::vector<int> ids;
    for(const auto& line : lines)
    {
        SCOPED_TRACE(line);
        // a line interleaved with another would not have this exact shape
        ASSERT_EQ(line.compare(0, prefix.length(), prefix), 0);
        const std::string id = line.substr(prefix.length());
        ASSERT_TRUE(util::is_all_digits(id));
        ids.push_back(std::stoi(id));
    }
    std::sort(ids.begin(), ids.end());
    for(int i = 0; i < num_threads * num_entries; ++i) { EXPECT_EQ(ids[i], i); }

    const auto io_lines = read_lines(dir / "diskIO-log.txt");
    ASSERT_EQ(io_lines.size(), 1u);
    EXPECT_EQ(io_lines[0], "[h|io] read 5 bytes");
}
