#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 규칙/규칙셋 데이터 모델 정의.
// RuleSetLoader 를 통해 JSON 규칙 파일에서 로드된다.
//
// [설계 원칙]
// - 로드 이후 불변 (immutable). 재설정은 새 RuleSet 을 만들어 교체한다.
//   RuleRegistry 는 std::shared_ptr<const RuleSet> 으로만 공유한다.
// - 심각도(Severity)는 카테고리에 명시적으로 부착된다.
//   목록 위치나 이름 규칙으로 추론하지 않는다 (정책 drift 방지).
// - 규칙 순서는 의미가 있다. PatternMatcher 의 overlap tie-break 는
//   rules 벡터의 앞쪽 규칙이 항상 이긴다.
//
// [순환 의존성]
// rule.hpp → common/types.hpp (단방향만)
// re2 는 전방 선언만 사용 (컴파일 의존성 최소화).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
}  // namespace re2

// ---------------------------------------------------------------------------
// MaskingMethod
//   매칭 구간에 적용할 변환. 규칙 파일의 masking_method 문자열과 1:1 대응.
//   kMask  : 카테고리 라벨 placeholder 로 치환 (예: "[EMAIL]")
//   kRedact: 길이 0 치환 (완전 삭제)
//   kHash  : 결정적 단방향 digest 로 치환
//   kNone  : 원문 유지, 감사 기록만 남김
// ---------------------------------------------------------------------------
enum class MaskingMethod : std::uint8_t {
    kMask   = 0,
    kRedact = 1,
    kHash   = 2,
    kNone   = 3,
};

// ---------------------------------------------------------------------------
// Severity
//   카테고리 심각도. 현재 스킴(severity_scheme = 1)은 두 단계만 정의한다.
//   kHigh 카테고리 매치는 무조건 Block.
// ---------------------------------------------------------------------------
enum class Severity : std::uint8_t {
    kLow  = 0,
    kHigh = 1,
};

// 현재 지원하는 심각도 스킴 버전. 이보다 큰 값을 선언한 파일은 거부한다.
inline constexpr int kSeveritySchemeVersion = 1;

[[nodiscard]] std::string_view      to_string(MaskingMethod method) noexcept;
[[nodiscard]] std::string_view      to_string(Severity severity) noexcept;
[[nodiscard]] std::optional<MaskingMethod> parse_masking_method(std::string_view text) noexcept;
[[nodiscard]] std::optional<Severity>      parse_severity(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// Category
//   규칙셋이 선언한 카테고리 하나. 규칙의 category 는 반드시 이 목록에 있어야 한다.
// ---------------------------------------------------------------------------
struct Category {
    std::string name{};
    Severity    severity{Severity::kLow};
};

// ---------------------------------------------------------------------------
// Rule
//   패턴 규칙 하나. id 는 규칙셋 안에서 유일하다.
//
//   country / language: 빈 문자열이면 모든 scope 에 적용.
//   mask_token: kMask 일 때 삽입할 placeholder. 로더가 기본값
//               "[<CATEGORY 대문자>]" 로 채운다.
//
//   [idempotence 전제]
//   placeholder 토큰은 어떤 패턴 규칙과도 매치되지 않아야 한다.
//   엔진은 이를 가정할 뿐 강제하지 않는다 (설정 책임).
// ---------------------------------------------------------------------------
struct Rule {
    std::string                     id{};
    std::string                     name{};
    std::string                     category{};
    std::string                     description{};
    std::string                     pattern_source{};  // 원본 정규식 (감사/프리뷰용)
    std::shared_ptr<const re2::RE2> pattern{};          // 컴파일된 정규식
    std::string                     country{};
    std::string                     language{};
    bool                            enabled{true};
    bool                            case_sensitive{false};
    MaskingMethod                   masking_method{MaskingMethod::kMask};
    std::string                     mask_token{};
};

// ---------------------------------------------------------------------------
// RuleSet
//   버전이 붙은 규칙 묶음 + 정책 메타데이터.
//   RuleSetLoader::load 가 반환하는 최종 결과물이며,
//   PatternMatcher / ComplianceEvaluator 가 읽기 전용으로 참조한다.
// ---------------------------------------------------------------------------
struct RuleSet {
    std::string              version{};
    std::string              last_updated{};
    int                      severity_scheme{kSeveritySchemeVersion};
    std::vector<Category>    categories{};        // 선언 순서 유지
    std::vector<Rule>        rules{};             // 순서 = 우선순위
    std::vector<std::string> forbidden_topics{};
    std::vector<std::string> guidelines{};
    std::string              source{};            // 로드한 파일 경로 (로깅용)

    [[nodiscard]] const Category* find_category(std::string_view name) const noexcept;
    [[nodiscard]] const Rule*     find_rule(std::string_view id) const noexcept;

    // 선언되지 않은 카테고리는 kHigh 로 취급한다 (fail-close).
    [[nodiscard]] Severity severity_of(std::string_view category) const noexcept;
};

using RuleSetPtr = std::shared_ptr<const RuleSet>;
