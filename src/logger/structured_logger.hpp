#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 한 이벤트 = 한 줄 JSON. 모든 필드는 snake_case 키로 직렬화한다.
// - 원문 입력/출력 텍스트는 어떤 경로로도 기록하지 않는다.
//
// [실패 처리]
// spdlog 는 sink 오류를 내부 error handler 로 보낸다. 이 로거는 handler 에서
// 실패 횟수를 세어 log_audit() 의 반환값으로 드러낸다 (AuditWriteError).
// 호출자는 실패를 통계/진단 로그에만 반영하고 응답은 바꾸지 않는다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "logger/log_types.hpp"
#include "pipeline/audit_record.hpp"
#include "stats/stats_collector.hpp"

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// JSON 직렬화 헬퍼 (CLI 응답 출력에서도 사용)
// ---------------------------------------------------------------------------
[[nodiscard]] std::string escape_json_string(std::string_view str);
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (rotating, 100MB x 3)
    //   console   : true 면 stderr 에도 출력 (stdout 은 CLI 응답 전용)
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path, bool console = true);

    // 임의 sink 주입 (테스트, 내장 배포)
    StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_audit
    //   AuditRecord 를 JSON 한 줄로 기록한다. Block 판정은 warn, 그 외는 info.
    //   실패 시 오류 설명을 반환한다.
    [[nodiscard]] std::expected<void, std::string> log_audit(const AuditRecord& record);

    // log_reload: RuleSet 재로드 결과
    void log_reload(const ReloadLog& entry);

    // log_stats: 통계 스냅샷 (종료 시 요약)
    void log_stats(const StatsSnapshot& snapshot);

    // 내부 진단용 spdlog 래퍼. 요청 텍스트를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // format_audit: log_audit 이 기록하는 JSON 본문
    [[nodiscard]] static std::string format_audit(const AuditRecord& record);

    [[nodiscard]] std::uint64_t write_failures() const noexcept {
        return failure_counter_->load(std::memory_order_relaxed);
    }

private:
    void init(std::vector<spdlog::sink_ptr> sinks);
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::shared_ptr<spdlog::logger> logger_;
    // error handler 가 갱신하므로 shared_ptr 로 수명을 handler 와 공유
    std::shared_ptr<std::atomic<std::uint64_t>> failure_counter_;
};
