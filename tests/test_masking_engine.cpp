// ---------------------------------------------------------------------------
// test_masking_engine.cpp
//
// MaskingEngine / digest 헬퍼 단위 테스트.
//
// [테스트 범위]
// - 전략별 치환: mask / redact / hash / none
// - 사용자 지정 mask_token
// - 여러 span 의 길이 변화가 서로의 offset 을 깨지 않는지 (뒤→앞 적용)
// - hash: 결정적, 값이 다르면 digest 도 다름, salt 반영
// - 규칙셋에 없는 rule_id → mask (fail-close)
// - 범위 밖 / 겹치는 span 은 건너뜀
// - idempotence: 정제 결과를 다시 매칭해도 새 span 이 생기지 않음 (배포 규칙셋 포함)
// - sha256_hex 알려진 벡터
// ---------------------------------------------------------------------------

#include "masking/digest.hpp"
#include "masking/masking_engine.hpp"
#include "matcher/pattern_matcher.hpp"
#include "policy/ruleset_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace {

constexpr const char* kRulesDocument = R"json({
  "version": "m1",
  "categories": ["email", "phone", "credit_card", "id_number", "note"],
  "rules": [
    { "id": "email_en", "category": "email", "pattern": "\\w+@\\w+\\.com", "masking_method": "mask" },
    { "id": "phone", "category": "phone", "pattern": "\\+?673\\d{7}", "mask_token": "<phone>" },
    { "id": "card", "category": "credit_card", "pattern": "\\d{4}-\\d{4}-\\d{4}-\\d{4}", "masking_method": "redact" },
    { "id": "ic", "category": "id_number", "pattern": "\\d{2}-\\d{6}", "masking_method": "hash" },
    { "id": "memo", "category": "note", "pattern": "memo", "masking_method": "none" }
  ]
})json";

class MaskingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = RuleSetLoader::load_string(kRulesDocument, "masking", LoaderOptions{});
        ASSERT_TRUE(result.has_value()) << result.error().message;
        ruleset_ = result->ruleset;
    }

    MaskingResult mask(const std::string& text, const MaskingEngine& engine = MaskingEngine{}) {
        const auto matched = matcher_.match(text, *ruleset_, Scope{});
        return engine.apply(text, matched.spans, *ruleset_);
    }

    RuleSetPtr     ruleset_;
    PatternMatcher matcher_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Apply_MaskWithCategoryToken
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_MaskWithCategoryToken) {
    const auto result = mask("My email is john@example.com");
    EXPECT_EQ(result.sanitized_text, "My email is [EMAIL]");
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].rule_id, "email_en");
    EXPECT_EQ(result.actions[0].method, MaskingMethod::kMask);
    EXPECT_TRUE(result.actions[0].neutralized());
    EXPECT_TRUE(result.actions[0].digest.empty());
}

TEST_F(MaskingEngineTest, Apply_CustomMaskToken) {
    const auto result = mask("Contact +6738123456 now");
    EXPECT_EQ(result.sanitized_text, "Contact <phone> now");
}

TEST_F(MaskingEngineTest, Apply_Redact) {
    const auto result = mask("card 1234-5678-9012-3456 ok");
    EXPECT_EQ(result.sanitized_text, "card  ok");
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].method, MaskingMethod::kRedact);
}

// ---------------------------------------------------------------------------
// Apply_HashIsDeterministic
//   같은 값 → 같은 토큰, 다른 값 → 다른 토큰. 원문은 남지 않는다.
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_HashIsDeterministic) {
    const auto first  = mask("ic 01-234567");
    const auto second = mask("ic 01-234567");
    const auto other  = mask("ic 01-765432");

    ASSERT_EQ(first.actions.size(), 1u);
    EXPECT_EQ(first.actions[0].method, MaskingMethod::kHash);
    EXPECT_EQ(first.actions[0].digest.size(), 16u);
    EXPECT_EQ(first.sanitized_text, "ic [ID_NUMBER:h" + first.actions[0].digest + "]");
    EXPECT_EQ(first.sanitized_text.find("234567"), std::string::npos);

    EXPECT_EQ(first.sanitized_text, second.sanitized_text);
    EXPECT_NE(first.sanitized_text, other.sanitized_text);
}

TEST_F(MaskingEngineTest, Apply_HashUsesSalt) {
    const auto unsalted = mask("ic 01-234567");
    const auto salted   = mask("ic 01-234567", MaskingEngine{"pepper"});
    ASSERT_EQ(salted.actions.size(), 1u);
    EXPECT_NE(unsalted.actions[0].digest, salted.actions[0].digest);
    EXPECT_EQ(salted.actions[0].digest, short_digest("01-234567", "pepper"));
}

// ---------------------------------------------------------------------------
// Apply_NoneKeepsOriginal
//   none 전략은 원문을 유지하지만 AppliedAction 은 남긴다.
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_NoneKeepsOriginal) {
    const auto result = mask("a memo here");
    EXPECT_EQ(result.sanitized_text, "a memo here");
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].method, MaskingMethod::kNone);
    EXPECT_FALSE(result.actions[0].neutralized());
}

// ---------------------------------------------------------------------------
// Apply_MultipleSpansKeepOffsets
//   길이가 다른 치환이 섞여도 모든 span 이 정확히 치환되어야 한다.
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_MultipleSpansKeepOffsets) {
    const auto result = mask("a@b.com, 1234-5678-9012-3456, +6738123456, c@d.com");
    EXPECT_EQ(result.sanitized_text, "[EMAIL], , <phone>, [EMAIL]");

    ASSERT_EQ(result.actions.size(), 4u);
    for (std::size_t i = 1; i < result.actions.size(); ++i) {
        EXPECT_LT(result.actions[i - 1].start, result.actions[i].start) << "actions ascending";
    }
    EXPECT_EQ(result.actions[0].start, 0u);
    EXPECT_EQ(result.actions[0].end, 7u) << "offsets refer to the original text";
}

// ---------------------------------------------------------------------------
// Apply_UnknownRuleFallsBackToMask
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_UnknownRuleFallsBackToMask) {
    const std::string text = "top secret value";
    const std::vector<MatchSpan> spans{MatchSpan{4, 10, "secret", "ghost_rule", "secret"}};

    const auto result = MaskingEngine{}.apply(text, spans, *ruleset_);
    EXPECT_EQ(result.sanitized_text, "top [SECRET] value");
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].method, MaskingMethod::kMask);
}

// ---------------------------------------------------------------------------
// Apply_InvalidSpansSkipped
//   범위 밖, 길이 0, 겹치는 span 은 적용하지 않는다.
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_InvalidSpansSkipped) {
    const std::string text = "abcdefghij";
    const std::vector<MatchSpan> spans{
        MatchSpan{0, 3, "abc", "email_en", "email"},
        MatchSpan{2, 5, "cde", "email_en", "email"},   // [0,3) 과 겹침
        MatchSpan{6, 6, "", "email_en", "email"},      // 길이 0
        MatchSpan{8, 20, "ij", "email_en", "email"},   // 범위 밖
    };

    const auto result = MaskingEngine{}.apply(text, spans, *ruleset_);
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].start, 2u) << "later span applied first, overlapping earlier one skipped";
    EXPECT_EQ(result.sanitized_text, "ab[EMAIL]fghij");
}

// ---------------------------------------------------------------------------
// Apply_Idempotent
//   정제 결과를 다시 매칭/마스킹해도 변하지 않아야 한다.
// ---------------------------------------------------------------------------
TEST_F(MaskingEngineTest, Apply_Idempotent) {
    const auto once  = mask("mail a@b.com, call +6738123456, card 1234-5678-9012-3456, ic 01-234567");
    const auto twice = mask(once.sanitized_text);

    EXPECT_EQ(once.sanitized_text, twice.sanitized_text);
    EXPECT_TRUE(twice.actions.empty()) << "placeholder tokens must not match any rule";
}

// ---------------------------------------------------------------------------
// Apply_IdempotentWithShippedRulesets
//   "00-002811" 의 digest 는 숫자 16자 (7573482603210445).
//   hash 토큰이 credit_card / bn_phone 같은 숫자열 규칙에 다시 걸리면 안 된다.
// ---------------------------------------------------------------------------
TEST(MaskingEngine, Apply_IdempotentWithShippedRulesets) {
    PatternMatcher matcher;
    MaskingEngine  engine;

    for (const char* path : {"config/rules/pii_rules.json", "config/rules/brunei_ms.json"}) {
        if (!std::filesystem::exists(path)) {
            GTEST_SKIP() << path << " not found from working directory";
        }
        const auto loaded = RuleSetLoader::load(path, LoaderOptions{});
        ASSERT_TRUE(loaded.has_value()) << path << ": " << loaded.error().message;
        const auto& ruleset = *loaded->ruleset;

        for (const std::string text : {"ic 00-002811", "ic 00-002811 and 01-234567, +6738123456"}) {
            const auto first  = matcher.match(text, ruleset, Scope{"BN", "ms", ""});
            const auto masked = engine.apply(text, first.spans, ruleset);
            ASSERT_FALSE(masked.actions.empty()) << path << ": " << text;

            const auto second = matcher.match(masked.sanitized_text, ruleset, Scope{"BN", "ms", ""});
            for (const auto& span : second.spans) {
                ADD_FAILURE() << path << ": rule '" << span.rule_id << "' matched placeholder in '"
                              << masked.sanitized_text << "'";
            }
        }
    }
}

TEST_F(MaskingEngineTest, Apply_NoSpansReturnsInput) {
    const auto result = mask("nothing to see");
    EXPECT_EQ(result.sanitized_text, "nothing to see");
    EXPECT_TRUE(result.actions.empty());
}

// ---------------------------------------------------------------------------
// Digest: 알려진 SHA-256 벡터
// ---------------------------------------------------------------------------
TEST(Digest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(short_digest("abc"), "ba7816bf8f01cfea");
}

TEST(Digest, SaltIsPrefixed) {
    EXPECT_EQ(sha256_hex("bc", "a"), sha256_hex("abc"));
    EXPECT_NE(sha256_hex("abc", "salt"), sha256_hex("abc"));
}
