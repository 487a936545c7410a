//! # Log Options
//!
//! `parse_log_options` turns the logging arguments of a command line, or the
//! `MSGCODEC_LOG` environment variable, into a `LogConfig`.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

namespace msgcodec::log {

namespace {

constexpr std::string_view LEVEL_OPT = "--log-level=";
constexpr std::string_view FILTER_OPT = "--log-filter=";
constexpr std::string_view FILE_OPT = "--log-file=";
constexpr std::string_view FORMAT_OPT = "--log-format=";

/// Number of 'v's in "-v", "-vv", ...; 0 for anything else.
auto verbosity(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-') {
        return 0;
    }
    auto vs = arg.substr(1);
    return vs.find_first_not_of('v') == std::string_view::npos ? static_cast<int>(vs.size()) : 0;
}

auto level_for_verbosity(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (auto prefix : {LEVEL_OPT, FILTER_OPT, FILE_OPT, FORMAT_OPT}) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "--log-async" || arg == "-q" || arg == "--quiet" || arg == "--verbose" ||
           verbosity(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

    std::optional<LogLevel> explicit_level;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with(LEVEL_OPT)) {
            explicit_level = parse_level(arg.substr(LEVEL_OPT.size()));
        } else if (arg.starts_with(FILTER_OPT)) {
            config.filter_spec = std::string(arg.substr(FILTER_OPT.size()));
        } else if (arg.starts_with(FILE_OPT)) {
            config.log_file = std::string(arg.substr(FILE_OPT.size()));
        } else if (arg.starts_with(FORMAT_OPT)) {
            auto format = arg.substr(FORMAT_OPT.size());
            config.format = (format == "json" || format == "JSON") ? LogFormat::JSON
                                                                   : LogFormat::Text;
        } else if (arg == "--log-async") {
            config.async = true;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose = std::max(verbose, 1);
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // An explicit level wins over -v
    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose > 0) {
        config.level = level_for_verbosity(verbose);
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("MSGCODEC_LOG");
        std::string_view value = env ? env : "";
        if (value.find_first_of("=,") != std::string_view::npos) {
            config.filter_spec = std::string(value);
        } else if (!value.empty()) {
            config.level = parse_level(value);
        }
    }

    return config;
}

} // namespace msgcodec::log
