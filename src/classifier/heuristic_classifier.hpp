#pragma once

// ---------------------------------------------------------------------------
// heuristic_classifier.hpp
//
// 정규식 패턴 기반 prompt-injection / 위험 지시 탐지기.
// 모델 기반 classifier 가 붙지 않은 배포(CLI 등)에서 ExternalClassifier 로 사용한다.
//
// [탐지 대상 패턴 (config classifier.patterns 에서 로드)]
// - "ignore (all) previous instructions" 류 지시 무력화
// - "you are now ..." 류 역할 탈취
// - 시스템 프롬프트 노출 요구
// 각 패턴은 (label, score) 를 가진다. 같은 label 이 여러 번 일치하면
// 가장 높은 score 하나만 verdict 로 반환한다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 동의어/의역: 패턴에 없는 표현은 탐지하지 못한다 (false negative).
// 2. 인코딩 우회: base64, 유니코드 동형 문자 등은 탐지 불가.
// 3. 패턴을 넓힐수록 정상 대화에서 false positive 가 증가한다.
//
// [Fail-close]
// 유효한 패턴이 하나도 없으면 classify() 는 매 호출 오류를 반환한다.
// 파이프라인은 이를 ExternalCapabilityError 로 받아 Block 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "classifier/capability.hpp"

namespace re2 {
class RE2;
}

struct HeuristicPattern {
    std::string label{};    // verdict label (예: "injection")
    std::string pattern{};  // RE2 문법, 대소문자 무시
    double      score{0.9};
};

class HeuristicClassifier final : public ExternalClassifier {
public:
    // 잘못된 패턴은 로그 후 건너뛴다. 유효한 나머지 패턴은 계속 적용된다.
    explicit HeuristicClassifier(const std::vector<HeuristicPattern>& patterns,
                                 std::int64_t regex_max_mem = 8 << 20);
    ~HeuristicClassifier() override;

    HeuristicClassifier(const HeuristicClassifier&)            = delete;
    HeuristicClassifier& operator=(const HeuristicClassifier&) = delete;

    [[nodiscard]] std::expected<std::vector<ClassifierVerdict>, std::string>
    classify(std::string_view text) override;

    [[nodiscard]] std::size_t pattern_count() const noexcept { return compiled_patterns_.size(); }

    // 설정이 비어 있을 때 쓰는 기본 패턴
    [[nodiscard]] static std::vector<HeuristicPattern> default_patterns();

private:
    struct CompiledPattern {
        std::string                       label;
        std::shared_ptr<const re2::RE2>   regex;
        double                            score;
    };
    std::vector<CompiledPattern> compiled_patterns_;
};
