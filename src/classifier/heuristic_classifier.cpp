// ---------------------------------------------------------------------------
// heuristic_classifier.cpp
//
// [기본 패턴]
//  1. ignore (all )?(the )?(previous|prior|above) (instructions|rules)  : 지시 무력화
//  2. disregard (all )?(your|the) (instructions|guidelines|rules)       : 지시 무력화
//  3. you are now (a|an|in) \w+                                         : 역할 탈취
//  4. (reveal|print|show) (me )?(your|the) system prompt                : 프롬프트 유출
//  5. (developer|jailbreak|dan) mode                                    : 탈옥 모드
//
// 패턴 4, 5 는 정상 질문("what is developer mode?")에서도 일치할 수 있어
// 점수를 block 임계값 아래로 둔다 (Warn).
// ---------------------------------------------------------------------------

#include "classifier/heuristic_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <re2/re2.h>
#include <spdlog/spdlog.h>

HeuristicClassifier::~HeuristicClassifier() = default;

HeuristicClassifier::HeuristicClassifier(const std::vector<HeuristicPattern>& patterns,
                                         std::int64_t                         regex_max_mem) {
    compiled_patterns_.reserve(patterns.size());

    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    options.set_max_mem(regex_max_mem);

    for (const auto& p : patterns) {
        if (p.label.empty()) {
            spdlog::warn("heuristic_classifier: pattern '{}' has no label, skipping", p.pattern);
            continue;
        }
        auto re = std::make_shared<const re2::RE2>(p.pattern, options);
        if (!re->ok()) {
            spdlog::warn("heuristic_classifier: invalid pattern '{}' for label '{}', skipping: {}",
                         p.pattern, p.label, re->error());
            continue;
        }
        const double score = std::isnan(p.score) ? 1.0 : std::clamp(p.score, 0.0, 1.0);
        compiled_patterns_.push_back(CompiledPattern{p.label, std::move(re), score});
    }

    if (compiled_patterns_.empty()) {
        spdlog::error("heuristic_classifier: no valid patterns loaded, "
                      "fail-close active, every request will be blocked");
    }
}

std::vector<HeuristicPattern> HeuristicClassifier::default_patterns() {
    return {
        {"injection", R"(ignore (all )?(the )?(previous|prior|above) (instructions|rules))", 0.9},
        {"injection", R"(disregard (all )?(your|the) (instructions|guidelines|rules))", 0.9},
        {"injection", R"(you are now (a|an|in) \w+)", 0.75},
        {"prompt-leak", R"((reveal|print|show) (me )?(your|the) system prompt)", 0.6},
        {"jailbreak", R"((developer|jailbreak|dan) mode)", 0.5},
    };
}

// ---------------------------------------------------------------------------
// HeuristicClassifier::classify 구현
// ---------------------------------------------------------------------------
std::expected<std::vector<ClassifierVerdict>, std::string>
HeuristicClassifier::classify(std::string_view text) {
    if (compiled_patterns_.empty()) {
        return std::unexpected(std::string("heuristic classifier has no valid patterns"));
    }

    // label → 최고 score, 최초 등장 순서 유지
    std::vector<ClassifierVerdict>     verdicts;
    std::map<std::string, std::size_t> index;

    const re2::StringPiece input(text.data(), text.size());
    for (const auto& cp : compiled_patterns_) {
        if (!re2::RE2::PartialMatch(input, *cp.regex)) {
            continue;
        }
        const auto [it, inserted] = index.emplace(cp.label, verdicts.size());
        if (inserted) {
            verdicts.push_back(ClassifierVerdict{cp.label, cp.score});
        } else {
            verdicts[it->second].score = std::max(verdicts[it->second].score, cp.score);
        }
    }
    return verdicts;
}
