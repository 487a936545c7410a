//! # Dump Tests
//!
//! Exit status and output of `dump_file` for missing, malformed and
//! well-formed input files.

#include "cli/dump.hpp"
#include "msgpack/value.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace msgcodec;
using msgcodec::msgpack::Value;
namespace fs = std::filesystem;

namespace {

auto write_file(const std::string& name, const std::vector<uint8_t>& bytes) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return path;
}

} // namespace

TEST(DumpTest, MissingFile) {
    auto path = fs::temp_directory_path() / "msgcodec_dump_missing.msgpack";
    fs::remove(path);
    std::ostringstream out;
    EXPECT_EQ(cli::dump_file(path.string(), out), 1);
    EXPECT_TRUE(out.str().empty());
}

TEST(DumpTest, PrintsOneValuePerLine) {
    auto path = write_file("msgcodec_dump_values.msgpack", {0x01, 0xa2, 'h', 'i', 0xc0});
    std::ostringstream out;
    EXPECT_EQ(cli::dump_file(path.string(), out), 0);
    EXPECT_EQ(out.str(), Value(1).to_string() + "\n" + Value("hi").to_string() + "\n" +
                             Value().to_string() + "\n");
    fs::remove(path);
}

TEST(DumpTest, EmptyFile) {
    auto path = write_file("msgcodec_dump_empty.msgpack", {});
    std::ostringstream out;
    EXPECT_EQ(cli::dump_file(path.string(), out), 0);
    EXPECT_TRUE(out.str().empty());
    fs::remove(path);
}

TEST(DumpTest, TruncatedArray) {
    auto path = write_file("msgcodec_dump_truncated.msgpack", {0x92, 0x01});
    std::ostringstream out;
    EXPECT_EQ(cli::dump_file(path.string(), out), 1);
    EXPECT_TRUE(out.str().empty());
    fs::remove(path);
}

TEST(DumpTest, ValuesBeforeBadByteArePrinted) {
    auto path = write_file("msgcodec_dump_reserved.msgpack", {0x07, 0xc1});
    std::ostringstream out;
    EXPECT_EQ(cli::dump_file(path.string(), out), 1);
    EXPECT_EQ(out.str(), Value(7).to_string() + "\n");
    fs::remove(path);
}
