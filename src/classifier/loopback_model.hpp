#pragma once

// ---------------------------------------------------------------------------
// loopback_model.hpp
//
// 정제된 입력을 그대로 돌려주는 ExternalModel.
// 실제 모델 서비스가 붙지 않은 CLI 에서 출력 측 정제/평가 경로를 실행하기 위해 쓴다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "classifier/capability.hpp"

class LoopbackModel final : public ExternalModel {
public:
    [[nodiscard]] std::expected<std::string, std::string>
    generate(std::string_view text, std::string_view /*system_prompt*/) override {
        return std::string(text);
    }
};
