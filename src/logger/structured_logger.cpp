// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr char kLoggerName[] = "promptgate";

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

void write_string_array(std::ostringstream& json, const std::vector<std::string>& values) {
    json << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(values[i]) << '"';
    }
    json << ']';
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path, bool console)
    : min_level_(min_level)
    , failure_counter_(std::make_shared<std::atomic<std::uint64_t>>(0))
{
    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path.string(), kMaxFileSize, kMaxFiles));

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
    init(std::move(sinks));
}

StructuredLogger::StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks)
    : min_level_(min_level)
    , failure_counter_(std::make_shared<std::atomic<std::uint64_t>>(0))
{
    init(std::move(sinks));
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::init(std::vector<spdlog::sink_ptr> sinks) {
    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(min_level_));

    // 한 줄 = 한 JSON 객체. 타임스탬프는 본문의 timestamp 필드로 기록한다.
    logger_->set_pattern("%v");

    // 감사 기록 유실 최소화: 매 로그마다 flush
    logger_->flush_on(spdlog::level::trace);

    logger_->set_error_handler([counter = failure_counter_](const std::string& msg) {
        counter->fetch_add(1, std::memory_order_relaxed);
        std::fprintf(stderr, "promptgate: audit sink error: %s\n", msg.c_str());
    });
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// format_audit: JSON 직렬화
// ---------------------------------------------------------------------------
std::string StructuredLogger::format_audit(const AuditRecord& record) {
    std::ostringstream json;
    json << R"({"event":"audit","correlation_id":")" << escape_json_string(record.correlation_id)
         << R"(","input_fingerprint":")" << record.input_fingerprint
         << R"(","ruleset_version":")" << escape_json_string(record.ruleset_version)
         << R"(","scope":{"country":")" << escape_json_string(record.scope.country)
         << R"(","language":")" << escape_json_string(record.scope.language)
         << R"(","domain":")" << escape_json_string(record.scope.domain)
         << R"("},"decision":")" << to_string(record.decision.status)
         << R"(","input_decision":")" << to_string(record.input_status)
         << R"(","output_decision":)";
    if (record.output_status) {
        json << '"' << to_string(*record.output_status) << '"';
    } else {
        json << "null";
    }
    json << R"(,"model_invoked":)" << (record.model_invoked ? "true" : "false")
         << R"(,"reasons":[)";

    for (std::size_t i = 0; i < record.decision.reasons.size(); ++i) {
        const auto& reason = record.decision.reasons[i];
        if (i > 0) {
            json << ',';
        }
        json << R"({"kind":")" << to_string(reason.kind)
             << R"(","ref":")" << escape_json_string(reason.ref)
             << R"(","detail":")" << escape_json_string(reason.detail) << R"("})";
    }

    json << R"(],"explanation":")" << escape_json_string(record.decision.explanation)
         << R"(","fired_rules":)";
    write_string_array(json, record.fired_rules);

    json << R"(,"actions":[)";
    for (std::size_t i = 0; i < record.actions.size(); ++i) {
        const auto& action = record.actions[i];
        if (i > 0) {
            json << ',';
        }
        json << R"({"rule_id":")" << escape_json_string(action.rule_id)
             << R"(","category":")" << escape_json_string(action.category)
             << R"(","method":")" << to_string(action.method)
             << R"(","start":)" << action.start
             << R"(,"end":)" << action.end;
        if (!action.digest.empty()) {
            json << R"(,"digest":")" << action.digest << '"';
        }
        json << '}';
    }

    json << R"(],"errors":)";
    write_string_array(json, record.errors);

    json << R"(,"timestamp":")" << format_iso8601(record.timestamp)
         << R"(","duration_us":)" << record.duration.count() << '}';
    return json.str();
}

// ---------------------------------------------------------------------------
// log_audit
// ---------------------------------------------------------------------------
std::expected<void, std::string> StructuredLogger::log_audit(const AuditRecord& record) {
    const LogLevel level = record.decision.blocked() ? LogLevel::kWarn : LogLevel::kInfo;
    if (!enabled(level)) {
        return {};
    }

    const auto failures_before = failure_counter_->load(std::memory_order_relaxed);
    try {
        const std::string line = format_audit(record);
        if (level == LogLevel::kWarn) {
            logger_->warn(line);
        } else {
            logger_->info(line);
        }
    } catch (const std::exception& e) {
        failure_counter_->fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(std::string("audit serialization failed: ") + e.what());
    }

    if (failure_counter_->load(std::memory_order_relaxed) != failures_before) {
        return std::unexpected(std::string("audit sink reported a write error"));
    }
    return {};
}

// ---------------------------------------------------------------------------
// log_reload / log_stats
// ---------------------------------------------------------------------------
void StructuredLogger::log_reload(const ReloadLog& entry) {
    const LogLevel level = entry.errors.empty() ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"ruleset_reload","activated":)" << entry.activated
         << R"(,"kept_previous":)" << entry.kept_previous
         << R"(,"rule_errors":)" << entry.rule_errors
         << R"(,"errors":)";
    write_string_array(json, entry.errors);
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (level == LogLevel::kWarn) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

void StructuredLogger::log_stats(const StatsSnapshot& snapshot) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"stats","total_requests":)" << snapshot.total_requests
         << R"(,"allowed":)" << snapshot.allowed
         << R"(,"masked":)" << snapshot.masked
         << R"(,"warned":)" << snapshot.warned
         << R"(,"blocked":)" << snapshot.blocked
         << R"(,"match_errors":)" << snapshot.match_errors
         << R"(,"external_failures":)" << snapshot.external_failures
         << R"(,"audit_write_failures":)" << snapshot.audit_write_failures
         << R"(,"reloads":)" << snapshot.reloads
         << R"(,"reload_failures":)" << snapshot.reload_failures
         << R"(,"rps":)" << snapshot.rps
         << R"(,"block_rate":)" << snapshot.block_rate
         << R"(,"timestamp":")" << format_iso8601(snapshot.captured_at) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
