// ---------------------------------------------------------------------------
// compliance_evaluator.cpp
// ---------------------------------------------------------------------------

#include "policy/compliance_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kUnsafeTopicPrefix = "unsafe-topic:";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

bool is_forbidden_topic(std::string_view label, const RuleSet& ruleset) {
    if (label.size() <= kUnsafeTopicPrefix.size() ||
        !iequals(label.substr(0, kUnsafeTopicPrefix.size()), kUnsafeTopicPrefix)) {
        return false;
    }
    const auto topic = label.substr(kUnsafeTopicPrefix.size());
    return std::any_of(ruleset.forbidden_topics.begin(), ruleset.forbidden_topics.end(),
                       [topic](const std::string& forbidden) { return iequals(forbidden, topic); });
}

// 같은 (kind, ref) 는 한 번만 기록
class ReasonList {
public:
    void add(ReasonKind kind, std::string ref, std::string detail) {
        if (!seen_.emplace(kind, ref).second) {
            return;
        }
        reasons_.push_back(Reason{kind, std::move(ref), std::move(detail)});
    }

    std::vector<Reason> release() { return std::move(reasons_); }

private:
    std::set<std::pair<ReasonKind, std::string>> seen_;
    std::vector<Reason>                          reasons_;
};

}  // namespace

std::string_view to_string(DecisionStatus status) noexcept {
    switch (status) {
        case DecisionStatus::kAllow: return "allow";
        case DecisionStatus::kMask:  return "mask";
        case DecisionStatus::kWarn:  return "warn";
        case DecisionStatus::kBlock: return "block";
    }
    return "block";
}

std::string_view to_string(ReasonKind kind) noexcept {
    switch (kind) {
        case ReasonKind::kRule:          return "rule";
        case ReasonKind::kClassifier:    return "classifier";
        case ReasonKind::kExternalError: return "external-error";
        case ReasonKind::kPolicy:        return "policy";
    }
    return "policy";
}

ComplianceEvaluator::ComplianceEvaluator(EvaluatorOptions options)
    : options_(options) {
    const bool valid = options_.warn_threshold >= 0.0 &&
                       options_.warn_threshold <= options_.block_threshold &&
                       options_.block_threshold <= 1.0;
    if (!valid) {
        spdlog::warn("compliance_evaluator: invalid thresholds warn={} block={}, using defaults",
                     options_.warn_threshold, options_.block_threshold);
        const EvaluatorOptions defaults{};
        options_.block_threshold = defaults.block_threshold;
        options_.warn_threshold  = defaults.warn_threshold;
    }
}

double ComplianceEvaluator::sanitize_score(double score) noexcept {
    if (std::isnan(score)) {
        return 1.0;
    }
    return std::clamp(score, 0.0, 1.0);
}

Decision ComplianceEvaluator::policy_block(std::string ref, std::string detail) {
    Decision decision{};
    decision.status      = DecisionStatus::kBlock;
    decision.explanation = fmt::format("blocked by pipeline policy: {}", ref);
    decision.reasons.push_back(Reason{ReasonKind::kPolicy, std::move(ref), std::move(detail)});
    return decision;
}

// ---------------------------------------------------------------------------
// ComplianceEvaluator::evaluate 구현
// ---------------------------------------------------------------------------
Decision ComplianceEvaluator::evaluate(const std::vector<MatchSpan>&         spans,
                                       const std::vector<AppliedAction>&     actions,
                                       const std::vector<ClassifierVerdict>& verdicts,
                                       const std::vector<ExternalError>&     external_errors,
                                       const RuleSet&                        ruleset) const {
    ReasonList  reasons;
    bool        block = false;
    bool        warn  = false;
    bool        mask  = false;
    std::string first_block_cause;

    const auto mark_block = [&](std::string cause) {
        if (!block) {
            first_block_cause = std::move(cause);
        }
        block = true;
    };

    // 1. 패턴 매치
    //    spans 와 actions 는 모두 start 오름차순이므로 cursor 하나로 짝을 맞춘다
    auto cursor = actions.begin();
    for (const auto& span : spans) {
        const Severity severity = ruleset.severity_of(span.category);

        while (cursor != actions.end() && cursor->start < span.start) {
            ++cursor;
        }
        auto action = actions.end();
        if (cursor != actions.end() && cursor->start == span.start && cursor->rule_id == span.rule_id) {
            action = cursor;
        }
        // 기록이 없으면 원문이 남아 있다고 본다
        const bool neutralized = action != actions.end() && action->neutralized();

        reasons.add(ReasonKind::kRule, span.rule_id,
                    fmt::format("category={} severity={} action={}", span.category,
                                to_string(severity),
                                action != actions.end() ? to_string(action->method) : "unapplied"));

        if (severity == Severity::kHigh) {
            mark_block(fmt::format("high-severity category '{}' (rule {})", span.category, span.rule_id));
        } else if (neutralized) {
            mask = true;
        } else {
            warn = true;
        }
    }

    // 2. classifier verdict
    for (const auto& verdict : verdicts) {
        const double score = sanitize_score(verdict.score);
        if (score < options_.warn_threshold) {
            spdlog::debug("compliance_evaluator: verdict '{}' score {:.3f} below warn threshold, ignored",
                          verdict.label, score);
            continue;
        }

        reasons.add(ReasonKind::kClassifier, verdict.label, fmt::format("score={:.3f}", score));

        if (score >= options_.block_threshold) {
            mark_block(fmt::format("verdict '{}' score {:.3f} >= block threshold {:.2f}",
                                   verdict.label, score, options_.block_threshold));
        } else if (is_forbidden_topic(verdict.label, ruleset)) {
            mark_block(fmt::format("forbidden topic verdict '{}'", verdict.label));
        } else {
            warn = true;
        }
    }

    // 3. 외부 capability 오류
    for (const auto& error : external_errors) {
        reasons.add(ReasonKind::kExternalError,
                    fmt::format("{}:{}", error.capability, to_string(error.code)),
                    error.message);
        if (options_.fail_open) {
            warn = true;
        } else {
            mark_block(fmt::format("{} {} (fail-closed)", error.capability, to_string(error.code)));
        }
    }

    Decision decision{};
    decision.reasons = reasons.release();

    if (block) {
        decision.status      = DecisionStatus::kBlock;
        decision.explanation = "blocked: " + first_block_cause;
    } else if (warn) {
        decision.status      = DecisionStatus::kWarn;
        decision.explanation = fmt::format("warning: {} trigger(s) present, not fully neutralized",
                                           decision.reasons.size());
    } else if (mask) {
        decision.status      = DecisionStatus::kMask;
        decision.explanation = fmt::format("content corrected: {} match(es) neutralized", spans.size());
    } else {
        decision.status      = DecisionStatus::kAllow;
        decision.explanation = "no policy triggers";
    }
    return decision;
}
