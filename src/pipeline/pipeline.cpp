// ---------------------------------------------------------------------------
// pipeline.cpp
//
// 요청 단위 오케스트레이션 구현.
//
// [감사 기록]
// finalize() 가 요청당 정확히 한 번 AuditRecord 를 조립해 응답에 넣고
// StructuredLogger 로 기록한다. 기록 실패는 통계와 진단 로그에만 반영되며
// 응답 내용은 바뀌지 않는다.
//
// [오류 문자열 형식]
//   "<input|output>:match:<code>:<rule_id>"
//   "<input|output>:external:<capability>:<code>"
// ---------------------------------------------------------------------------

#include "pipeline/pipeline.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "logger/structured_logger.hpp"
#include "masking/digest.hpp"
#include "pipeline/system_prompt.hpp"
#include "stats/stats_collector.hpp"

namespace {

std::string new_correlation_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string describe_scope(const Scope& scope) {
    return fmt::format("country='{}' language='{}' domain='{}'",
                       scope.country, scope.language, scope.domain);
}

// 입력 판정과 출력 판정을 합친다. 사유는 입력 → 출력 순.
Decision combine(const Decision& input, const Decision& output) {
    Decision combined{};
    combined.status  = most_restrictive(input.status, output.status);
    combined.reasons = input.reasons;
    combined.reasons.insert(combined.reasons.end(), output.reasons.begin(), output.reasons.end());

    if (output.status > input.status) {
        combined.explanation = "output " + output.explanation;
    } else if (output.status == DecisionStatus::kAllow) {
        combined.explanation = input.explanation;
    } else {
        combined.explanation = input.explanation + "; output " + output.explanation;
    }
    return combined;
}

}  // namespace

std::string_view to_string(PipelineState state) noexcept {
    switch (state) {
        case PipelineState::kReceived:         return "received";
        case PipelineState::kScoped:           return "scoped";
        case PipelineState::kSanitizingInput:  return "sanitizing-input";
        case PipelineState::kClassifying:      return "classifying";
        case PipelineState::kEvaluating:       return "evaluating";
        case PipelineState::kForwarding:       return "forwarding";
        case PipelineState::kSanitizingOutput: return "sanitizing-output";
        case PipelineState::kEvaluatingOutput: return "evaluating-output";
        case PipelineState::kBlocked:          return "blocked";
        case PipelineState::kCompleted:        return "completed";
    }
    return "blocked";
}

// ---------------------------------------------------------------------------
// Stage: 요청 하나의 작업 상태
// ---------------------------------------------------------------------------
struct Pipeline::Stage {
    explicit Stage(const PipelineRequest& req) : request(req) {}

    const PipelineRequest&                request;
    PipelineResponse                      response{};
    RuleSetPtr                            snapshot{};
    std::vector<MatchSpan>                input_spans{};
    std::vector<MatchSpan>                output_spans{};
    std::size_t                           match_errors{0};
    std::size_t                           external_failures{0};
    std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

    void enter(PipelineState state) {
        response.state = state;
        response.trace.push_back(state);
    }

    void block(Decision decision) {
        response.decision = std::move(decision);
        enter(PipelineState::kBlocked);
    }

    void record_match_errors(std::string_view side, const std::vector<MatchError>& errors) {
        for (const auto& error : errors) {
            response.audit.errors.push_back(
                fmt::format("{}:match:{}:{}", side, to_string(error.code), error.rule_id));
        }
        match_errors += errors.size();
    }

    void record_external_error(std::string_view side, const ExternalError& error) {
        response.audit.errors.push_back(
            fmt::format("{}:external:{}:{}", side, error.capability, to_string(error.code)));
        ++external_failures;
    }
};

Pipeline::Pipeline(RuleRegistry&                       registry,
                   std::shared_ptr<ExternalClassifier> classifier,
                   std::shared_ptr<ExternalModel>      model,
                   PipelineOptions                     options,
                   std::shared_ptr<StructuredLogger>   audit_logger,
                   std::shared_ptr<StatsCollector>     stats)
    : registry_(registry)
    , classifier_(std::move(classifier))
    , model_(std::move(model))
    , options_(std::move(options))
    , audit_logger_(std::move(audit_logger))
    , stats_(std::move(stats))
    , matcher_(options_.matcher)
    , masking_(options_.fingerprint_salt)
    , evaluator_(options_.evaluator)
    , invoker_(options_.worker_threads)
{
    if (!classifier_) {
        spdlog::warn("pipeline: no classifier attached, every request will be blocked (fail-close)");
    }
    if (!model_) {
        spdlog::warn("pipeline: no model attached, forwarded requests will fail");
    }
}

Pipeline::~Pipeline() = default;

// ---------------------------------------------------------------------------
// process
// ---------------------------------------------------------------------------
PipelineResponse Pipeline::process(const PipelineRequest& request) {
    Stage stage{request};
    auto& response = stage.response;
    response.audit.timestamp = std::chrono::system_clock::now();
    response.audit.scope     = request.scope;

    // [Fail-close] 처리 중 예외는 차단으로 귀결되고 감사 기록은 그대로 남는다
    const auto fail_internal = [&stage, &response](const std::string& detail) {
        if (response.audit.correlation_id.empty()) {
            response.audit.correlation_id = "unassigned";
        }
        spdlog::error("pipeline: request '{}' failed internally: {}",
                      response.audit.correlation_id, detail);
        response.output_text.reset();
        response.input_decision = ComplianceEvaluator::policy_block("internal-error", detail);
        stage.block(response.input_decision);
    };

    try {
        response.audit.correlation_id = request.correlation_id.value_or(new_correlation_id());
        response.audit.input_fingerprint = sha256_hex(request.text, options_.fingerprint_salt);
        run(stage);
    } catch (const std::exception& e) {
        fail_internal(e.what());
    } catch (...) {
        fail_internal("non-standard exception");
    }

    finalize(stage);
    return std::move(stage.response);
}

// ---------------------------------------------------------------------------
// run: 상태 전이 본체
// ---------------------------------------------------------------------------
void Pipeline::run(Stage& stage) {
    const auto& request  = stage.request;
    auto&       response = stage.response;

    stage.enter(PipelineState::kReceived);

    if (request.text.size() > options_.max_input_bytes) {
        spdlog::warn("pipeline: request '{}' input {} bytes exceeds limit {}",
                     response.audit.correlation_id, request.text.size(), options_.max_input_bytes);
        response.input_decision = ComplianceEvaluator::policy_block(
            "input-too-large",
            fmt::format("{} bytes exceeds limit of {}", request.text.size(), options_.max_input_bytes));
        stage.block(response.input_decision);
        return;
    }

    // ── Scoped: 요청 시작 시 스냅샷 한 번 취득 ─────────────────────────
    stage.snapshot = registry_.current(request.scope);
    if (!stage.snapshot) {
        spdlog::warn("pipeline: no active ruleset for {}", describe_scope(request.scope));
        response.input_decision = ComplianceEvaluator::policy_block(
            "no-ruleset", "no active ruleset for " + describe_scope(request.scope));
        stage.block(response.input_decision);
        return;
    }
    const RuleSet& ruleset = *stage.snapshot;
    stage.enter(PipelineState::kScoped);

    // ── Sanitizing(input): classifier/model 이전에 반드시 수행 ──────────
    stage.enter(PipelineState::kSanitizingInput);
    auto matched = matcher_.match(request.text, ruleset, request.scope);
    stage.record_match_errors("input", matched.errors);
    auto masked = masking_.apply(request.text, matched.spans, ruleset);
    response.sanitized_input = std::move(masked.sanitized_text);
    stage.input_spans        = std::move(matched.spans);
    response.audit.actions   = masked.actions;

    // ── Classifying ───────────────────────────────────────────────────
    stage.enter(PipelineState::kClassifying);
    std::vector<ClassifierVerdict> verdicts;
    std::vector<ExternalError>     external_errors;
    if (auto classified = invoker_.classify(classifier_, response.sanitized_input,
                                            options_.classifier_timeout)) {
        verdicts = std::move(*classified);
    } else {
        stage.record_external_error("input", classified.error());
        external_errors.push_back(std::move(classified.error()));
    }

    // ── Evaluating ────────────────────────────────────────────────────
    stage.enter(PipelineState::kEvaluating);
    response.input_decision =
        evaluator_.evaluate(stage.input_spans, masked.actions, verdicts, external_errors, ruleset);

    if (response.input_decision.blocked()) {
        stage.block(response.input_decision);
        return;
    }

    // ── Forwarding: 외부 모델 호출 ─────────────────────────────────────
    stage.enter(PipelineState::kForwarding);
    response.audit.model_invoked = true;
    auto generated = invoker_.generate(model_, response.sanitized_input,
                                       build_system_prompt(ruleset, request.scope),
                                       options_.model_timeout);

    if (!generated) {
        stage.record_external_error("output", generated.error());
        response.output_decision = evaluator_.evaluate({}, {}, {}, {generated.error()}, ruleset);
    } else {
        // ── Sanitizing(output) / Evaluating(output) ────────────────────
        stage.enter(PipelineState::kSanitizingOutput);
        auto out_matched = matcher_.match(*generated, ruleset, request.scope);
        stage.record_match_errors("output", out_matched.errors);
        auto out_masked = masking_.apply(*generated, out_matched.spans, ruleset);
        response.audit.actions.insert(response.audit.actions.end(),
                                      out_masked.actions.begin(), out_masked.actions.end());

        stage.enter(PipelineState::kEvaluatingOutput);
        response.output_decision =
            evaluator_.evaluate(out_matched.spans, out_masked.actions, {}, {}, ruleset);
        stage.output_spans = std::move(out_matched.spans);

        if (!response.output_decision->blocked()) {
            response.output_text = std::move(out_masked.sanitized_text);
        }
    }

    response.decision = combine(response.input_decision, *response.output_decision);
    stage.enter(response.decision.blocked() ? PipelineState::kBlocked : PipelineState::kCompleted);
}

// ---------------------------------------------------------------------------
// finalize: 감사 기록 조립 + 통계 + 기록
// ---------------------------------------------------------------------------
void Pipeline::finalize(Stage& stage) {
    auto& response = stage.response;
    auto& audit    = response.audit;

    audit.ruleset_version = stage.snapshot ? stage.snapshot->version : std::string{};
    audit.decision        = response.decision;
    audit.input_status    = response.input_decision.status;
    if (response.output_decision) {
        audit.output_status = response.output_decision->status;
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto* spans : {&stage.input_spans, &stage.output_spans}) {
        for (const auto& span : *spans) {
            if (!seen.emplace(span.rule_id, span.category).second) {
                continue;
            }
            if (std::find(audit.fired_rules.begin(), audit.fired_rules.end(), span.rule_id) ==
                audit.fired_rules.end()) {
                audit.fired_rules.push_back(span.rule_id);
            }
            response.triggers.push_back(Trigger{span.rule_id, span.category});
        }
    }

    audit.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - stage.started);

    if (stats_) {
        stats_->on_request(response.decision.status);
        stats_->on_match_errors(stage.match_errors);
        for (std::size_t i = 0; i < stage.external_failures; ++i) {
            stats_->on_external_failure();
        }
    }

    spdlog::debug("pipeline: request '{}' {} ({} rules fired, {}us)",
                  audit.correlation_id, to_string(response.decision.status),
                  audit.fired_rules.size(), audit.duration.count());

    if (!audit_logger_) {
        return;
    }
    // AuditWriteError: 응답에는 영향 없음
    if (auto written = audit_logger_->log_audit(audit); !written) {
        spdlog::error("pipeline: audit write failed for request '{}': {}",
                      audit.correlation_id, written.error());
        if (stats_) {
            stats_->on_audit_write_failure();
        }
    }
}

// ---------------------------------------------------------------------------
// process_batch
// ---------------------------------------------------------------------------
std::vector<PipelineResponse> Pipeline::process_batch(const std::vector<PipelineRequest>& requests) {
    std::vector<PipelineResponse> responses;
    responses.reserve(requests.size());
    for (const auto& request : requests) {
        responses.push_back(process(request));
    }
    return responses;
}

// ---------------------------------------------------------------------------
// preview (dry run)
// ---------------------------------------------------------------------------
PreviewResult Pipeline::preview(std::string_view text, const RuleSet& ruleset, const Scope& scope) const {
    PreviewResult result{};
    auto matched = matcher_.match(text, ruleset, scope);
    auto masked  = masking_.apply(text, matched.spans, ruleset);

    result.decision       = evaluator_.evaluate(matched.spans, masked.actions, {}, {}, ruleset);
    result.sanitized_text = std::move(masked.sanitized_text);
    result.actions        = std::move(masked.actions);
    result.errors         = std::move(matched.errors);
    return result;
}
