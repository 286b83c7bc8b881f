#pragma once

// ---------------------------------------------------------------------------
// compliance_evaluator.hpp
//
// 매칭 span, 마스킹 결과, classifier verdict, 외부 호출 오류를 하나의
// 정책 판정(Decision)으로 합친다. 순수 함수이며 I/O 를 수행하지 않는다.
//
// [판정 순서 (심각도 전순서: Block > Warn > Mask > Allow)]
// 1. high severity 카테고리 매치                       → Block
// 2. verdict score >= block_threshold                   → Block
// 3. forbidden_topics 에 속한 "unsafe-topic:<topic>"
//    verdict (score >= warn_threshold)                  → Block
// 4. ExternalError (fail_open == false)                 → Block (fail-close)
// 5. warn_threshold <= score < block_threshold verdict  → Warn
// 6. 전략이 none 인 low severity 매치 (원문 잔존)       → Warn
// 7. ExternalError (fail_open == true)                  → Warn
// 8. 모든 매치가 mask/redact/hash 로 무력화됨           → Mask
// 9. 그 외                                              → Allow
//
// score < warn_threshold 인 verdict 는 잡음으로 간주하여 무시한다.
// NaN score 는 1.0 으로, 범위 밖 score 는 [0, 1] 로 보정한다 (fail-close).
//
// [Reason 순서]
// span(시작 offset 오름차순) → verdict(수신 순서) → 외부 오류 순으로 기록한다.
// 같은 규칙이 여러 번 발동해도 reason 은 한 번만 남긴다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"              // ClassifierVerdict, ExternalError
#include "masking/masking_engine.hpp"    // AppliedAction
#include "matcher/pattern_matcher.hpp"   // MatchSpan
#include "policy/rule.hpp"               // RuleSet

// ---------------------------------------------------------------------------
// DecisionStatus
//   값이 클수록 제한적이다. most_restrictive() 가 이 순서에 의존한다.
// ---------------------------------------------------------------------------
enum class DecisionStatus : std::uint8_t {
    kAllow = 0,  // 트리거 없음
    kMask  = 1,  // 콘텐츠가 정제됨, 정제본으로 진행
    kWarn  = 2,  // 진행하되 경고
    kBlock = 3,  // 차단
};

enum class ReasonKind : std::uint8_t {
    kRule          = 0,  // ref = rule id
    kClassifier    = 1,  // ref = verdict label
    kExternalError = 2,  // ref = "<capability>:<code>"
    kPolicy        = 3,  // ref = "no-ruleset" | "input-too-large" 등 파이프라인 정책
};

struct Reason {
    ReasonKind  kind{ReasonKind::kPolicy};
    std::string ref{};
    std::string detail{};  // 원문을 포함하지 않는다
};

// ---------------------------------------------------------------------------
// Decision
//   기본값은 Block (fail-close). Allow 는 evaluate() 가 명시적으로 결정할 때만.
// ---------------------------------------------------------------------------
struct Decision {
    DecisionStatus      status{DecisionStatus::kBlock};
    std::vector<Reason> reasons{};
    std::string         explanation{};

    [[nodiscard]] bool blocked() const noexcept { return status == DecisionStatus::kBlock; }
};

[[nodiscard]] std::string_view to_string(DecisionStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ReasonKind kind) noexcept;

[[nodiscard]] constexpr DecisionStatus most_restrictive(DecisionStatus a, DecisionStatus b) noexcept {
    return a > b ? a : b;
}

struct EvaluatorOptions {
    double block_threshold{0.7};
    double warn_threshold{0.3};
    bool   fail_open{false};
};

// ---------------------------------------------------------------------------
// ComplianceEvaluator
//   상태 없음. 여러 스레드에서 동시에 evaluate() 호출 가능.
// ---------------------------------------------------------------------------
class ComplianceEvaluator {
public:
    // 0 <= warn <= block <= 1 을 만족하지 않으면 기본 임계값으로 되돌리고 경고한다.
    explicit ComplianceEvaluator(EvaluatorOptions options = {});

    // spans / actions 는 start 오름차순 (PatternMatcher / MaskingEngine 출력 그대로)
    [[nodiscard]] Decision evaluate(const std::vector<MatchSpan>&         spans,
                                    const std::vector<AppliedAction>&     actions,
                                    const std::vector<ClassifierVerdict>& verdicts,
                                    const std::vector<ExternalError>&     external_errors,
                                    const RuleSet&                        ruleset) const;

    // 파이프라인 정책 사유(no-ruleset, input-too-large)로 즉시 차단하는 Decision
    [[nodiscard]] static Decision policy_block(std::string ref, std::string detail);

    [[nodiscard]] const EvaluatorOptions& options() const noexcept { return options_; }

    // NaN → 1.0, [0, 1] 로 clamp
    [[nodiscard]] static double sanitize_score(double score) noexcept;

private:
    EvaluatorOptions options_;
};
