#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - 이 파일의 어떤 구조체도 원문 입력/출력 텍스트를 담지 않는다.
// - 감사 기록(AuditRecord)은 pipeline/audit_record.hpp 에 정의되며
//   fingerprint 와 rule id 만 포함한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level: "debug" | "info" | "warn" | "warning" | "error" (대소문자 무시)
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        return LogLevel::kDebug;
    }
    if (lower == "info") {
        return LogLevel::kInfo;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::kWarn;
    }
    if (lower == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ReloadLog
//   RuleSet 재로드 결과 이벤트.
//   errors: "<path>: <message>" 형식의 설정 오류 요약
// ---------------------------------------------------------------------------
struct ReloadLog {
    std::size_t                           activated{0};
    std::size_t                           kept_previous{0};
    std::size_t                           rule_errors{0};
    std::vector<std::string>              errors{};
    std::chrono::system_clock::time_point timestamp{};
};
