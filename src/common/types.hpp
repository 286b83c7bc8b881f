#pragma once

#include <compare>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// Scope
//   요청 하나가 어떤 RuleSet 스냅샷을 사용할지 결정하는 키.
//   빈 문자열 필드 = 지정 없음 (와일드카드).
//   pipeline 레이어가 요청에서 생성하고 registry/matcher 에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct Scope {
    std::string country{};   // ISO 국가 코드 (예: "BN", "SG")
    std::string language{};  // 언어 코드 (예: "en", "ms")
    std::string domain{};    // 정책 도메인 (예: "islamic", "pii")

    [[nodiscard]] bool empty() const noexcept {
        return country.empty() && language.empty() && domain.empty();
    }

    friend bool operator==(const Scope&, const Scope&) = default;
    friend auto operator<=>(const Scope&, const Scope&) = default;
};

// ---------------------------------------------------------------------------
// ClassifierVerdict
//   외부 classifier 가 돌려주는 판정 하나. label/score 외의 의미는 해석하지 않는다.
//   label 예: "injection", "unsafe-topic:gambling"
//   score 는 [0, 1] 이어야 하나 외부 입력이므로 평가 시점에 보정한다.
// ---------------------------------------------------------------------------
struct ClassifierVerdict {
    std::string label{};
    double      score{0.0};
};

// ---------------------------------------------------------------------------
// ConfigErrorCode / ConfigError
//   RuleSet 파일 또는 서비스 설정 로드 실패 (ConfigurationError).
//   해당 RuleSet 활성화에 치명적이다. 이전 스냅샷은 그대로 유지된다.
//   운영자에게만 보고하며 최종 호출자에게 노출하지 않는다.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kFileNotFound   = 0,  // 파일 경로 해석 실패
    kParseError     = 1,  // JSON/YAML 문법 오류
    kSchemaError    = 2,  // 필수 필드 누락, 타입 불일치
    kNoValidRules   = 3,  // 검증 후 남은 규칙 0개
    kDuplicateScope = 4,  // 같은 scope 키로 두 개 이상의 파일이 설정됨
};

struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kSchemaError};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 파일 경로 등 (로깅용)
};

// ---------------------------------------------------------------------------
// RuleErrorCode / RuleError
//   규칙 하나가 검증에 실패한 경우 (RuleError).
//   해당 규칙만 스냅샷에서 제외하고 로드는 계속한다 (경고 수준).
// ---------------------------------------------------------------------------
enum class RuleErrorCode : std::uint8_t {
    kMissingField         = 0,  // id / category / pattern 누락
    kInvalidField         = 1,  // 필드 타입 불일치 (예: enabled 가 bool 아님)
    kDuplicateId          = 2,
    kInvalidPattern       = 3,  // 정규식 컴파일 실패
    kUnknownCategory      = 4,  // categories 목록에 없는 카테고리
    kUnknownMaskingMethod = 5,  // {mask, redact, hash, none} 외의 값
};

struct RuleError {
    RuleErrorCode code{RuleErrorCode::kMissingField};
    std::string   rule_id{};   // 식별 불가 시 "#<index>"
    std::string   message{};
};

// ---------------------------------------------------------------------------
// MatchErrorCode / MatchError
//   매칭 도중 특정 규칙의 평가가 실패한 경우 (MatchRuntimeError).
//   이번 요청에 한해 그 규칙만 건너뛴다. 나머지 규칙은 계속 평가된다.
// ---------------------------------------------------------------------------
enum class MatchErrorCode : std::uint8_t {
    kBudgetExceeded     = 0,  // 규칙별 시간 예산 초과
    kMatchLimitExceeded = 1,  // 규칙별 최대 매치 수 초과
    kEngineFailure      = 2,  // 정규식 엔진 내부 실패
};

struct MatchError {
    MatchErrorCode code{MatchErrorCode::kEngineFailure};
    std::string    rule_id{};
    std::string    message{};
};

// ---------------------------------------------------------------------------
// ExternalErrorCode / ExternalError
//   외부 classifier / model 호출 실패 (ExternalCapabilityError).
//   기본 정책은 fail-close: 최고 심각도 verdict 와 동일하게 취급 → Block.
// ---------------------------------------------------------------------------
enum class ExternalErrorCode : std::uint8_t {
    kTimeout     = 0,  // 지정된 timeout 안에 응답 없음
    kFailure     = 1,  // 호출 자체가 오류 반환 또는 예외
    kUnavailable = 2,  // capability 가 주입되지 않음
};

struct ExternalError {
    ExternalErrorCode code{ExternalErrorCode::kFailure};
    std::string       capability{};  // "classifier" | "model"
    std::string       message{};
};

[[nodiscard]] inline const char* to_string(ExternalErrorCode code) noexcept {
    switch (code) {
        case ExternalErrorCode::kTimeout:     return "timeout";
        case ExternalErrorCode::kFailure:     return "failure";
        case ExternalErrorCode::kUnavailable: return "unavailable";
    }
    return "failure";
}

[[nodiscard]] inline const char* to_string(MatchErrorCode code) noexcept {
    switch (code) {
        case MatchErrorCode::kBudgetExceeded:     return "budget-exceeded";
        case MatchErrorCode::kMatchLimitExceeded: return "match-limit-exceeded";
        case MatchErrorCode::kEngineFailure:      return "engine-failure";
    }
    return "engine-failure";
}

[[nodiscard]] inline const char* to_string(RuleErrorCode code) noexcept {
    switch (code) {
        case RuleErrorCode::kMissingField:         return "missing-field";
        case RuleErrorCode::kInvalidField:         return "invalid-field";
        case RuleErrorCode::kDuplicateId:          return "duplicate-id";
        case RuleErrorCode::kInvalidPattern:       return "invalid-pattern";
        case RuleErrorCode::kUnknownCategory:      return "unknown-category";
        case RuleErrorCode::kUnknownMaskingMethod: return "unknown-masking-method";
    }
    return "invalid-field";
}
