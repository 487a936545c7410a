//! # msgdump
//!
//! Prints every top-level MessagePack value in a file, one per line.
//!
//! ## Usage
//!
//! ```bash
//! msgdump data.msgpack              # Dump all values
//! msgdump -vv data.msgpack          # Also log decoder progress
//! msgdump --log-format=json data.msgpack
//! ```
//!
//! Exits with 0 when the whole file decodes, 1 on a usage, read or decode
//! error. Errors go through the logger under module `msgdump`.

#include "cli/dump.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>

using namespace msgcodec;

namespace {

void print_usage() {
    std::cerr << "Usage: msgdump [options] <file>\n";
    std::cerr << "Options:\n";
    std::cerr << "  --log-level=<level>   Minimum log level (trace..fatal, off)\n";
    std::cerr << "  --log-filter=<spec>   Per-module levels, e.g. \"msgdump=debug,*=warn\"\n";
    std::cerr << "  --log-file=<path>     Also write log records to a file\n";
    std::cerr << "  --log-format=<fmt>    text or json\n";
    std::cerr << "  -v, -vv, -vvv         Increase verbosity\n";
    std::cerr << "  --log-async           Publish log records from a background thread\n";
    std::cerr << "  -q                    Only log errors\n";
    std::cerr << "  --version, -V         Show version\n";
}

} // namespace

int main(int argc, char* argv[]) {
    msgcodec::log::Logger::init(msgcodec::log::parse_log_options(argc, argv));

    std::string path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (msgcodec::log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            std::cout << "msgdump " << VERSION << "\n";
            return 0;
        }
        if (!path.empty()) {
            print_usage();
            return 1;
        }
        path = arg;
    }

    if (path.empty()) {
        print_usage();
        return 1;
    }

    int status = cli::dump_file(path, std::cout);
    msgcodec::log::Logger::instance().flush();
    return status;
}
