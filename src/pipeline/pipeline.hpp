#pragma once

// ---------------------------------------------------------------------------
// pipeline.hpp
//
// 요청 하나를 정제 → 분류 → 평가 → (모델 호출) → 출력 정제 → 출력 평가 순으로
// 처리하고 감사 기록을 조립하는 오케스트레이터.
//
// [상태 전이]
//   Received → Scoped → SanitizingInput → Classifying → Evaluating
//     → [Blocked]
//     → Forwarding → SanitizingOutput → EvaluatingOutput → [Completed] / [Blocked]
//
// [보안 불변식: 절대 위반 금지]
// 1. 원문 입력은 PatternMatcher + MaskingEngine 을 거치기 전에 classifier /
//    model 로 넘어가지 않는다. 두 capability 는 sanitized_input 만 받는다.
// 2. 입력 판정이 Block 이면 model 은 호출되지 않는다.
// 3. 외부 capability 오류는 fail_open 설정이 없는 한 Block 으로 귀결된다.
// 4. 활성 RuleSet 이 없는 scope → Block ("no-ruleset").
// 5. max_input_bytes 초과 입력 → Block ("input-too-large"), 매칭도 수행하지 않는다.
// 6. 처리 중 예외 → Block ("internal-error").
//
// [스레드 안전성]
// process() 는 요청 로컬 상태만 사용하며 RuleRegistry 스냅샷은 요청 시작 시
// 한 번 취득해 끝까지 사용한다. 여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "classifier/capability.hpp"
#include "classifier/timed_invoker.hpp"
#include "common/types.hpp"
#include "masking/masking_engine.hpp"
#include "matcher/pattern_matcher.hpp"
#include "pipeline/audit_record.hpp"
#include "policy/compliance_evaluator.hpp"
#include "policy/rule_registry.hpp"

class StructuredLogger;
class StatsCollector;

enum class PipelineState : std::uint8_t {
    kReceived         = 0,
    kScoped           = 1,
    kSanitizingInput  = 2,
    kClassifying      = 3,
    kEvaluating       = 4,
    kForwarding       = 5,
    kSanitizingOutput = 6,
    kEvaluatingOutput = 7,
    kBlocked          = 8,  // 종료 상태
    kCompleted        = 9,  // 종료 상태
};

[[nodiscard]] std::string_view to_string(PipelineState state) noexcept;

struct PipelineOptions {
    EvaluatorOptions          evaluator{};
    MatchOptions              matcher{};
    std::chrono::milliseconds classifier_timeout{2000};
    std::chrono::milliseconds model_timeout{30000};
    std::size_t               max_input_bytes{65536};
    std::string               fingerprint_salt{};  // fingerprint 와 hash 전략 digest 공용
    std::size_t               worker_threads{2};   // 외부 호출용 thread_pool 크기
};

struct PipelineRequest {
    std::string                text{};
    Scope                      scope{};
    std::optional<std::string> correlation_id{};
};

// 응답에 노출되는 트리거 (rule id + category, 원문 없음)
struct Trigger {
    std::string rule_id{};
    std::string category{};
};

struct PipelineResponse {
    PipelineState              state{PipelineState::kBlocked};
    std::string                sanitized_input{};
    std::optional<std::string> output_text{};       // 정제된 모델 출력. 미호출/차단 시 nullopt
    Decision                   decision{};          // 최종 (입력/출력 중 더 제한적인 쪽)
    Decision                   input_decision{};
    std::optional<Decision>    output_decision{};
    std::vector<Trigger>       triggers{};
    std::vector<PipelineState> trace{};             // 거쳐간 상태 (종료 상태 포함)
    AuditRecord                audit{};
};

// preview (dry run) 결과. classifier / model 은 호출하지 않는다.
struct PreviewResult {
    std::string                sanitized_text{};
    std::vector<AppliedAction> actions{};
    std::vector<MatchError>    errors{};
    Decision                   decision{};
};

class Pipeline {
public:
    // classifier / model 이 nullptr 이면 호출 시 kUnavailable 오류 → fail-close.
    // logger / stats 는 선택 (nullptr 허용).
    Pipeline(RuleRegistry&                       registry,
             std::shared_ptr<ExternalClassifier> classifier,
             std::shared_ptr<ExternalModel>      model,
             PipelineOptions                     options,
             std::shared_ptr<StructuredLogger>   audit_logger = nullptr,
             std::shared_ptr<StatsCollector>     stats        = nullptr);

    ~Pipeline();

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // process: 요청 하나를 끝까지 처리한다. 예외를 던지지 않는다.
    [[nodiscard]] PipelineResponse process(const PipelineRequest& request);

    // process_batch: 순서대로 독립 처리, 요청당 응답 하나
    [[nodiscard]] std::vector<PipelineResponse> process_batch(const std::vector<PipelineRequest>& requests);

    // preview: 후보 RuleSet 으로 match + mask + evaluate 만 수행 (활성화 없음)
    [[nodiscard]] PreviewResult preview(std::string_view text, const RuleSet& ruleset, const Scope& scope) const;

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    struct Stage;  // 요청 로컬 작업 상태 (pipeline.cpp)

    void run(Stage& stage);
    void finalize(Stage& stage);

    RuleRegistry&                       registry_;
    std::shared_ptr<ExternalClassifier> classifier_;
    std::shared_ptr<ExternalModel>      model_;
    PipelineOptions                     options_;
    std::shared_ptr<StructuredLogger>   audit_logger_;
    std::shared_ptr<StatsCollector>     stats_;

    PatternMatcher      matcher_;
    MaskingEngine       masking_;
    ComplianceEvaluator evaluator_;
    TimedInvoker        invoker_;
};
