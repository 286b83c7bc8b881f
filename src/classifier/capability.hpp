#pragma once

// ---------------------------------------------------------------------------
// capability.hpp
//
// 파이프라인이 소비하는 외부 capability 인터페이스.
// 분류기 학습/모델 로딩/추론 내부는 이 프로젝트의 소관이 아니다.
//
// [호출 규약]
// - 파이프라인은 항상 정제된(sanitized) 텍스트만 전달한다.
// - 구현은 예외를 던져도 되고 unexpected 를 반환해도 된다.
//   TimedInvoker 가 둘 다 ExternalError 로 변환한다.
// - 구현은 여러 스레드에서 동시에 호출될 수 있다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ClassifierVerdict

class ExternalClassifier {
public:
    virtual ~ExternalClassifier() = default;

    // classify: 텍스트에 대한 verdict 목록. 실패 시 오류 메시지.
    [[nodiscard]] virtual std::expected<std::vector<ClassifierVerdict>, std::string>
    classify(std::string_view text) = 0;
};

class ExternalModel {
public:
    virtual ~ExternalModel() = default;

    // generate: system_prompt 와 정제된 입력으로 출력 텍스트를 생성한다.
    [[nodiscard]] virtual std::expected<std::string, std::string>
    generate(std::string_view text, std::string_view system_prompt) = 0;
};
