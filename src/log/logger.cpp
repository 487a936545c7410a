//! # Logger Implementation
//!
//! Level names, formatting, the sinks, the module filter and the global
//! logger.

#include "log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace msgcodec::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelNames {
    const char* name;
    const char* short_name;
    const char* color;
};

// Indexed by LogLevel
constexpr LevelNames LEVELS[] = {
    {"TRACE", "TR", "\033[90m"}, {"DEBUG", "DB", "\033[36m"}, {"INFO", "IN", "\033[32m"},
    {"WARN", "WN", "\033[33m"},  {"ERROR", "ER", "\033[31m"}, {"FATAL", "FA", "\033[1;31m"},
    {"OFF", "--", ""},
};

auto level_names(LogLevel level) -> const LevelNames* {
    auto index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::Off)) {
        return nullptr;
    }
    return &LEVELS[index];
}

} // namespace

const char* level_name(LogLevel level) {
    const auto* names = level_names(level);
    return names ? names->name : "???";
}

const char* level_short_name(LogLevel level) {
    const auto* names = level_names(level);
    return names ? names->short_name : "??";
}

LogLevel parse_level(std::string_view s) {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        std::string_view upper = LEVELS[i].name;
        if (s.size() != upper.size()) {
            continue;
        }
        bool lower_match = true;
        for (size_t j = 0; j < s.size(); ++j) {
            if (s[j] != upper[j] + ('a' - 'A')) {
                lower_match = false;
                break;
            }
        }
        if (s == upper || lower_match) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Time
// ============================================================================

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_time(int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif
    char out[16];
    std::snprintf(out, sizeof(out), "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min,
                  tm_buf.tm_sec, static_cast<int>(timestamp_ms % 1000));
    return out;
}

// ============================================================================
// Formatting
// ============================================================================

LogFormatter::LogFormatter(std::string_view format_template) : template_(format_template) {}

std::string LogFormatter::format(const LogRecord& record) const {
    std::string out;
    out.reserve(template_.size() + record.message.size() + 32);

    size_t pos = 0;
    while (pos < template_.size()) {
        size_t open = template_.find('{', pos);
        size_t close = open == std::string::npos ? open : template_.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(template_, pos, std::string::npos);
            break;
        }
        out.append(template_, pos, open - pos);

        auto token = std::string_view(template_).substr(open + 1, close - open - 1);
        if (token == "time") {
            out += format_time(record.timestamp_ms);
        } else if (token == "time_ms") {
            out += std::to_string(record.timestamp_ms);
        } else if (token == "level") {
            out += level_name(record.level);
        } else if (token == "level_short") {
            out += level_short_name(record.level);
        } else if (token == "module") {
            out += record.module;
        } else if (token == "message") {
            if (record.message.find('\n') != std::string::npos) {
                out += '\n';
            }
            out += record.message;
        } else if (token == "file") {
            out += record.file ? record.file : "";
        } else if (token == "line") {
            out += std::to_string(record.line);
        } else if (token == "thread") {
            std::ostringstream id;
            id << std::this_thread::get_id();
            out += id.str();
        } else {
            out.append(template_, open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

static void append_json_string(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                out += escaped;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

std::string format_json(const LogRecord& record) {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":";
    append_json_string(out, level_name(record.level));
    out += ",\"module\":";
    append_json_string(out, record.module);
    out += ",\"msg\":";
    append_json_string(out, record.message);
    out += '}';
    return out;
}

// ============================================================================
// ConsoleSink
// ============================================================================

static bool stderr_supports_color() {
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (handle == INVALID_HANDLE_VALUE || !GetConsoleMode(handle, &mode)) {
        return false;
    }
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
#endif
}

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string line;
    if (format_ == LogFormat::JSON) {
        line = format_json(record);
    } else if (colors_enabled_) {
        const auto* names = level_names(record.level);
        line = std::string(names ? names->color : "") + formatter_.format(record) + "\033[0m";
    } else {
        line = formatter_.format(record);
    }
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : formatter_.format(record))
          << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MultiSink
// ============================================================================

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// AsyncSink
// ============================================================================

AsyncSink::AsyncSink(std::unique_ptr<LogSink> parent)
    : parent_(std::move(parent)), worker_([this] { run(); }) {}

AsyncSink::~AsyncSink() {
    close();
}

void AsyncSink::write(const LogRecord& record) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_.load())
            return;
        queue_.push_back(QueuedRecord{record.level, std::string(record.module), record.message,
                                      record.file, record.line, record.timestamp_ms});
    }
    not_empty_.notify_one();
}

void AsyncSink::flush() {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    publish_queued();
    parent_->flush();
}

void AsyncSink::close() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_.exchange(true))
            return;
    }
    not_empty_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    parent_->flush();
}

size_t AsyncSink::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AsyncSink::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            not_empty_.wait(lock, [this] { return closed_.load() || !queue_.empty(); });
            if (queue_.empty())
                return; // closed and drained
        }
        std::lock_guard<std::mutex> publish_lock(publish_mutex_);
        publish_queued();
    }
}

void AsyncSink::publish_queued() {
    std::deque<QueuedRecord> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }
    for (const auto& record : batch) {
        parent_->write(record.view());
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        auto item = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (item.empty()) {
            continue;
        }

        size_t eq = item.find('=');
        auto module = item.substr(0, eq);
        auto level =
            eq == std::string_view::npos ? LogLevel::Trace : parse_level(item.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

LogLevel LogFilter::level_for(std::string_view module) const {
    while (true) {
        auto it = module_levels_.find(std::string(module));
        if (it != module_levels_.end()) {
            return it->second;
        }
        size_t dot = module.rfind('.');
        if (dot == std::string_view::npos) {
            return default_level_;
        }
        module = module.substr(0, dot);
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    return level >= level_for(module);
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [module, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto outputs = std::make_unique<MultiSink>();
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        outputs->add(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            file->set_format(config.format);
            outputs->add(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    LogFilter filter;
    filter.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        filter.parse(config.filter_spec);
        // A filter without "*=level" keeps the configured default
        if (config.level < filter.default_level()) {
            filter.set_default_level(config.level);
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = std::move(filter);
    logger.level_ = logger.filter_.min_level();
    logger.sinks_.clear();
    if (outputs->size() == 0) {
        return;
    }
    if (config.async) {
        logger.sinks_.push_back(std::make_unique<AsyncSink>(std::move(outputs)));
    } else {
        logger.sinks_.push_back(std::move(outputs));
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    // Lock-free rejection below every module's level
    if (level < level_.load())
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    level_ = filter_.min_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace msgcodec::log
