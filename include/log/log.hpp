//! # msgcodec Logging
//!
//! Module-tagged logging shared by the library and `msgdump`.
//!
//! | Piece | Role |
//! |-------|------|
//! | `Logger` | Process-wide dispatcher; drops everything until a sink is added |
//! | `LogFilter` | Per-module minimum levels, `"codec=trace,*=warn"` |
//! | `LogFormatter` | `{token}` templates for text output |
//! | `LogSink` | Output: console, file, fan-out, asynchronous |
//! | `MSGCODEC_LOG_*` | Macros that skip message construction when filtered |
//!
//! ## Modules
//!
//! Module names are dotted paths. A filter entry for `codec` also covers
//! `codec.factory` unless that module has an entry of its own. The library
//! logs under:
//!
//! - `codec.factory`: codec derivation and recursive-type rejection
//! - `msgdump`: the command-line tool
//!
//! ## Usage
//!
//! ```cpp
//! MSGCODEC_LOG_TRACE("codec.factory", "derived " << codec->name());
//! MSGCODEC_LOG_ERROR("msgdump", path << ": " << err.to_string());
//! ```
//!
//! Compile with `-DMSGCODEC_MIN_LOG_LEVEL=2` to remove Trace and Debug
//! statements entirely.

#ifndef MSGCODEC_LOG_HPP
#define MSGCODEC_LOG_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace msgcodec::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6, ///< Above every level; disables output
};

/// Upper-case name ("TRACE" ... "FATAL", "OFF").
const char* level_name(LogLevel level);

/// Two-letter name used in compact text output (TR, DB, IN, WN, ER, FA).
const char* level_short_name(LogLevel level);

/// Parses "trace" ... "off" in lower or upper case. Anything else is Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Records
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Only valid for the duration of `LogSink::write`
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the epoch
};

enum class LogFormat {
    Text,
    JSON, ///< One object per line: ts, level, module, msg
};

/// Milliseconds since the epoch.
int64_t epoch_ms();

/// Local wall-clock time of `timestamp_ms` as "HH:MM:SS.mmm".
std::string format_time(int64_t timestamp_ms);

// ============================================================================
// Formatting
// ============================================================================

/// Renders records through a template.
///
/// | Token | Expands to |
/// |-------|------------|
/// | `{time}` | record time as HH:MM:SS.mmm |
/// | `{time_ms}` | record time in epoch milliseconds |
/// | `{level}`, `{level_short}` | `level_name`, `level_short_name` |
/// | `{module}`, `{message}` | record fields |
/// | `{file}`, `{line}` | source location |
/// | `{thread}` | id of the formatting thread |
///
/// Unknown tokens and unmatched braces are copied through. A message that
/// spans several lines starts on a line of its own so that its continuation
/// lines stay aligned.
class LogFormatter {
public:
    static constexpr std::string_view DEFAULT_TEMPLATE =
        "{time} {level_short} [{module}] {message}";

    explicit LogFormatter(std::string_view format_template = DEFAULT_TEMPLATE);

    std::string format(const LogRecord& record) const;

    void set_template(std::string_view format_template) {
        template_ = std::string(format_template);
    }

    const std::string& get_template() const {
        return template_;
    }

private:
    std::string template_;
};

/// Renders a record as a single-line JSON object.
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Levels are colored when stderr is a color terminal and
/// colors were requested.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    void set_template(std::string_view format_template) {
        formatter_.set_template(format_template);
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Writes to a file, flushing after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

    void set_template(std::string_view format_template) {
        formatter_.set_template(format_template);
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Forwards every record to each child sink in insertion order.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Hands records to a worker thread that writes them to `parent`.
///
/// `write()` only copies the record into a queue. The worker and `flush()`
/// both publish under one lock, so `parent` sees records in the order they
/// were written. `close()`, also run by the destructor, publishes what is
/// still queued and joins the worker; later writes are dropped.
class AsyncSink : public LogSink {
public:
    explicit AsyncSink(std::unique_ptr<LogSink> parent);
    ~AsyncSink() override;

    AsyncSink(const AsyncSink&) = delete;
    AsyncSink& operator=(const AsyncSink&) = delete;

    void write(const LogRecord& record) override;

    /// Publishes the queue on the calling thread, then flushes `parent`.
    void flush() override;

    void close();

    bool is_closed() const {
        return closed_.load();
    }

    /// Records not yet handed to `parent`.
    size_t pending() const;

private:
    struct QueuedRecord {
        LogLevel level;
        std::string module;
        std::string message;
        const char* file;
        int line;
        int64_t timestamp_ms;

        LogRecord view() const {
            return LogRecord{level, module, message, file, line, timestamp_ms};
        }
    };

    void run();

    /// Writes every queued record to `parent_`. Caller holds `publish_mutex_`.
    void publish_queued();

    std::unique_ptr<LogSink> parent_;
    std::deque<QueuedRecord> queue_;
    mutable std::mutex queue_mutex_;
    std::mutex publish_mutex_;
    std::condition_variable not_empty_;
    std::atomic<bool> closed_{false};
    std::thread worker_;
};

// ============================================================================
// Filtering
// ============================================================================

/// Per-module minimum levels.
///
/// A module without an entry uses its closest dotted ancestor that has one
/// (`codec.factory` falls back to `codec`), then the default level.
class LogFilter {
public:
    /// Replaces all module entries with those in `spec`:
    /// comma-separated `module=level` items, `*=level` for the default, and
    /// bare `module` meaning `module=trace`.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    /// Effective level of `module` after ancestor fallback.
    LogLevel level_for(std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module can pass; the logger's lock-free fast path.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Overrides `level` per module when non-empty
    std::string log_file;    ///< Also log to this file when non-empty
    bool console = true;
    bool colors = true;
    bool async = false; ///< Publish through an `AsyncSink`
};

class Logger {
public:
    /// Replaces the sinks and filter of the global logger.
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    /// Writes to every sink. Does not consult the filter.
    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the default level, keeping module entries.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load();
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Builds a `LogConfig` from the logging options in `argv`:
///
/// | Option | Effect |
/// |--------|--------|
/// | `--log-level=<level>` | default level |
/// | `--log-filter=<spec>` | per-module levels |
/// | `--log-file=<path>` | additional file output |
/// | `--log-format=text\|json` | output format |
/// | `--log-async` | publish from a background thread |
/// | `-v`, `-vv`, `-vvv` | Info, Debug, Trace |
/// | `-q`, `--quiet` | Error |
///
/// Without a level or filter option, `MSGCODEC_LOG` is read instead: a
/// value containing `=` or `,` is a filter, anything else a level. The
/// default level is Warn.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for every argument `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 5=Fatal; statements below this level compile to nothing.
#ifndef MSGCODEC_MIN_LOG_LEVEL
#define MSGCODEC_MIN_LOG_LEVEL 0
#endif

#define MSGCODEC_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if constexpr (static_cast<int>(level) >= MSGCODEC_MIN_LOG_LEVEL) {                         \
            auto& logger_ = ::msgcodec::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define MSGCODEC_LOG_TRACE(module, msg)                                                            \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Trace, module, msg)

#define MSGCODEC_LOG_DEBUG(module, msg)                                                            \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Debug, module, msg)

#define MSGCODEC_LOG_INFO(module, msg)                                                             \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Info, module, msg)

#define MSGCODEC_LOG_WARN(module, msg)                                                             \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Warn, module, msg)

#define MSGCODEC_LOG_ERROR(module, msg)                                                            \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Error, module, msg)

#define MSGCODEC_LOG_FATAL(module, msg)                                                            \
    MSGCODEC_LOG_IMPL(::msgcodec::log::LogLevel::Fatal, module, msg)

} // namespace msgcodec::log

#endif // MSGCODEC_LOG_HPP
