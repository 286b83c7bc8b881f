// ---------------------------------------------------------------------------
// ruleset_loader.cpp
//
// JSON 규칙 파일을 로드하여 불변 RuleSet 으로 변환한다.
//
// [설계 원칙]
// - 규칙 단위 격리: 규칙 하나의 오류가 규칙셋 전체를 무효화하지 않는다.
// - Fail-close: 유효하고 활성화된 규칙이 0개면 std::unexpected 반환.
// - 문서 내용을 로그에 출력하지 않는다 (민감 정보 보호).
// - 선택 필드 누락 시 기본값(구조체 기본값)을 적용한다.
//
// [검증 순서 (규칙 하나당)]
// 1. 객체 여부 / id, category, pattern 존재
// 2. id 중복 (먼저 나온 규칙이 유지됨)
// 3. category 가 categories 목록에 있는지
// 4. masking_method 가 {mask, redact, hash, none} 중 하나인지
// 5. pattern 이 RE2 로 컴파일되는지
//
// [알려진 한계]
// - 매치 offset 은 UTF-8 바이트 단위다 (문자 단위 아님).
// - RE2 는 backreference/lookaround 를 지원하지 않는다. 그런 패턴은
//   kInvalidPattern 으로 제외된다 (선형 시간 매칭 보장의 대가).
// ---------------------------------------------------------------------------

#include "policy/ruleset_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>

#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 노드에서 string 값을 읽는다. 없거나 scalar 가 아니면 nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> read_scalar(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    return read_scalar(node).value_or(fallback);
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: string sequence 읽기. 노드가 없거나 sequence 가 아니면 빈 벡터.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[nodiscard]] std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: categories 파싱
//   "email"                                → 설정(high_severity_categories)에 따라 심각도 결정
//   { "name": "royal", "severity": "high" } → 명시 심각도 우선
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<Category>
parse_categories(const YAML::Node& node, const LoaderOptions& options) {
    std::unordered_set<std::string> high_set;
    for (const auto& name : options.high_severity_categories) {
        high_set.insert(to_lower(name));
    }

    std::vector<Category> categories;
    if (!node || !node.IsSequence()) {
        return categories;
    }

    for (const auto& item : node) {
        Category category{};
        std::optional<Severity> explicit_severity;

        if (item.IsScalar()) {
            category.name = item.as<std::string>();
        } else if (item.IsMap()) {
            category.name = read_string(item["name"], "");
            if (const auto sev = read_scalar(item["severity"])) {
                explicit_severity = parse_severity(*sev);
                if (!explicit_severity) {
                    spdlog::warn("ruleset_loader: category '{}' has unknown severity '{}', "
                                 "treating as high (fail-close)", category.name, *sev);
                    explicit_severity = Severity::kHigh;
                }
            }
        }

        if (category.name.empty()) {
            spdlog::warn("ruleset_loader: skipping unnamed category entry");
            continue;
        }
        const bool duplicate = std::any_of(categories.begin(), categories.end(),
            [&category](const Category& c) { return c.name == category.name; });
        if (duplicate) {
            spdlog::warn("ruleset_loader: duplicate category '{}' ignored", category.name);
            continue;
        }

        if (explicit_severity) {
            category.severity = *explicit_severity;
        } else {
            category.severity = high_set.contains(to_lower(category.name))
                              ? Severity::kHigh
                              : Severity::kLow;
        }
        categories.push_back(std::move(category));
    }
    return categories;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 규칙 하나 파싱 + 검증
//   실패 시 RuleError 반환. 성공 시 컴파일된 Rule.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Rule, RuleError>
parse_rule(const YAML::Node&     node,
           std::size_t           index,
           const RuleSet&        ruleset,
           const LoaderOptions&  options) {
    const std::string fallback_id = fmt::format("#{}", index);

    if (!node.IsMap()) {
        return std::unexpected(RuleError{
            RuleErrorCode::kInvalidField, fallback_id, "rule entry is not an object"});
    }

    Rule rule{};
    rule.id = read_string(node["id"], "");
    if (rule.id.empty()) {
        return std::unexpected(RuleError{
            RuleErrorCode::kMissingField, fallback_id, "missing 'id'"});
    }

    const auto category = read_scalar(node["category"]);
    if (!category || category->empty()) {
        return std::unexpected(RuleError{
            RuleErrorCode::kMissingField, rule.id, "missing 'category'"});
    }
    rule.category = *category;

    const auto pattern = read_scalar(node["pattern"]);
    if (!pattern || pattern->empty()) {
        return std::unexpected(RuleError{
            RuleErrorCode::kMissingField, rule.id, "missing 'pattern'"});
    }
    rule.pattern_source = *pattern;

    if (ruleset.find_rule(rule.id) != nullptr) {
        return std::unexpected(RuleError{
            RuleErrorCode::kDuplicateId, rule.id, "duplicate rule id (first definition kept)"});
    }

    if (ruleset.find_category(rule.category) == nullptr) {
        return std::unexpected(RuleError{
            RuleErrorCode::kUnknownCategory, rule.id,
            fmt::format("category '{}' is not declared in 'categories'", rule.category)});
    }

    // masking_method: 없으면 mask (원래 시스템 기본값과 동일)
    if (node["masking_method"]) {
        const auto raw    = read_scalar(node["masking_method"]);
        const auto method = raw ? parse_masking_method(*raw) : std::nullopt;
        if (!method) {
            return std::unexpected(RuleError{
                RuleErrorCode::kUnknownMaskingMethod, rule.id,
                fmt::format("masking_method '{}' is not one of mask|redact|hash|none",
                            raw.value_or("<non-scalar>"))});
        }
        rule.masking_method = *method;
    }

    // bool 필드: 존재하면 반드시 bool 이어야 한다
    try {
        if (node["enabled"]) {
            rule.enabled = node["enabled"].as<bool>();
        }
        if (node["case_sensitive"]) {
            rule.case_sensitive = node["case_sensitive"].as<bool>();
        }
    } catch (const YAML::Exception&) {
        return std::unexpected(RuleError{
            RuleErrorCode::kInvalidField, rule.id, "'enabled'/'case_sensitive' must be boolean"});
    }

    rule.name        = read_string(node["name"], rule.id);
    rule.description = read_string(node["description"], "");
    rule.country     = read_string(node["country"], "");
    rule.language    = read_string(node["language"], "");
    rule.mask_token  = read_string(node["mask_token"], "[" + to_upper(rule.category) + "]");

    // 원래 시스템은 country 미지정 규칙을 "international" 로 저장했다.
    // 의미상 scope 제한 없음과 같으므로 빈 값으로 정규화한다.
    if (to_lower(rule.country) == "international") {
        rule.country.clear();
    }

    re2::RE2::Options re_opts;
    re_opts.set_case_sensitive(rule.case_sensitive);
    re_opts.set_log_errors(false);
    re_opts.set_max_mem(options.regex_max_mem);

    auto compiled = std::make_shared<re2::RE2>(rule.pattern_source, re_opts);
    if (!compiled->ok()) {
        return std::unexpected(RuleError{
            RuleErrorCode::kInvalidPattern, rule.id,
            fmt::format("pattern does not compile: {}", compiled->error())});
    }
    rule.pattern = std::move(compiled);

    return rule;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 로드 통계 로그 (버전, 규칙 수, 카테고리별 규칙 수)
// ---------------------------------------------------------------------------
void log_statistics(const RuleSet& rs, std::size_t dropped) {
    spdlog::info(
        "ruleset_loader: loaded '{}': version={}, last_updated={}, rules={}, dropped={}, "
        "categories={}, guidelines={}, forbidden_topics={}",
        rs.source, rs.version, rs.last_updated.empty() ? "N/A" : rs.last_updated,
        rs.rules.size(), dropped, rs.categories.size(),
        rs.guidelines.size(), rs.forbidden_topics.size());

    std::map<std::string, std::size_t> per_category;
    for (const auto& rule : rs.rules) {
        ++per_category[rule.category];
    }
    for (const auto& [category, count] : per_category) {
        spdlog::debug("ruleset_loader:   {} ({}): {} rules", category,
                      to_string(rs.severity_of(category)), count);
    }
}

[[nodiscard]] std::expected<LoadResult, ConfigError>
build_ruleset(const YAML::Node& root, std::string_view origin, const LoaderOptions& options) {
    if (!root || !root.IsMap()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError,
            "ruleset document is not an object (top-level)", std::string(origin)});
    }

    auto rs    = std::make_shared<RuleSet>();
    rs->source = std::string(origin);

    const auto version = read_scalar(root["version"]);
    if (!version || version->empty()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError, "missing 'version'", std::string(origin)});
    }
    rs->version      = *version;
    rs->last_updated = read_string(root["last_updated"], "");

    if (root["severity_scheme"]) {
        int scheme = 0;
        try {
            scheme = root["severity_scheme"].as<int>();
        } catch (const YAML::Exception&) {
            scheme = -1;
        }
        if (scheme < 1 || scheme > kSeveritySchemeVersion) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kSchemaError,
                fmt::format("unsupported severity_scheme (supported: {})", kSeveritySchemeVersion),
                std::string(origin)});
        }
        rs->severity_scheme = scheme;
    }

    rs->categories = parse_categories(root["categories"], options);
    if (rs->categories.empty()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError, "'categories' must be a non-empty list",
            std::string(origin)});
    }

    rs->guidelines       = read_string_sequence(root["guidelines"]);
    rs->forbidden_topics = read_string_sequence(root["forbidden_topics"]);

    const YAML::Node& rules_node = root["rules"];
    if (!rules_node || !rules_node.IsSequence()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError, "'rules' must be a list", std::string(origin)});
    }

    LoadResult result{};
    rs->rules.reserve(rules_node.size());

    std::size_t index = 0;
    for (const auto& rule_node : rules_node) {
        auto rule = parse_rule(rule_node, index++, *rs, options);
        if (!rule) {
            spdlog::warn("ruleset_loader: rule '{}' dropped from '{}' ({}): {}",
                         rule.error().rule_id, origin,
                         to_string(rule.error().code), rule.error().message);
            result.rule_errors.push_back(std::move(rule.error()));
            continue;
        }
        rs->rules.push_back(std::move(*rule));
    }

    // 유효하고 활성화된 규칙이 하나도 없으면 설정 오류 (fail-close)
    const bool any_usable = std::any_of(rs->rules.begin(), rs->rules.end(),
                                        [](const Rule& r) { return r.enabled; });
    if (!any_usable) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNoValidRules,
            fmt::format("no usable rules remain ({} dropped)", result.rule_errors.size()),
            std::string(origin)});
    }

    log_statistics(*rs, result.rule_errors.size());
    result.ruleset = std::move(rs);
    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleSetLoader::load_string 구현
// ---------------------------------------------------------------------------
std::expected<LoadResult, ConfigError>
RuleSetLoader::load_string(std::string_view     document,
                           std::string_view     origin,
                           const LoaderOptions& options) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        ConfigError err{
            ConfigErrorCode::kParseError,
            fmt::format("parse error at line {}, col {}: {}",
                        e.mark.line + 1, e.mark.column + 1, e.msg),
            std::string(origin)};
        spdlog::error("ruleset_loader: '{}': {}", origin, err.message);
        return std::unexpected(std::move(err));
    } catch (const YAML::Exception& e) {
        ConfigError err{ConfigErrorCode::kParseError, e.what(), std::string(origin)};
        spdlog::error("ruleset_loader: '{}': {}", origin, err.message);
        return std::unexpected(std::move(err));
    }

    try {
        auto result = build_ruleset(root, origin, options);
        if (!result) {
            spdlog::error("ruleset_loader: '{}' rejected: {}", origin, result.error().message);
        }
        return result;
    } catch (const YAML::Exception& e) {
        ConfigError err{ConfigErrorCode::kSchemaError, e.what(), std::string(origin)};
        spdlog::error("ruleset_loader: '{}': {}", origin, err.message);
        return std::unexpected(std::move(err));
    }
}

// ---------------------------------------------------------------------------
// RuleSetLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<LoadResult, ConfigError>
RuleSetLoader::load(const std::filesystem::path& path, const LoaderOptions& options) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        ConfigError err{
            ConfigErrorCode::kFileNotFound,
            fmt::format("cannot resolve path: {}", ec.message()),
            path.string()};
        spdlog::error("ruleset_loader: '{}': {}", path.string(), err.message);
        return std::unexpected(std::move(err));
    }

    // 2. 파일 읽기
    std::ifstream in(canonical_path, std::ios::binary);
    if (!in) {
        ConfigError err{ConfigErrorCode::kFileNotFound, "cannot open file",
                        canonical_path.string()};
        spdlog::error("ruleset_loader: '{}': {}", canonical_path.string(), err.message);
        return std::unexpected(std::move(err));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    spdlog::info("ruleset_loader: loading ruleset from '{}'", canonical_path.string());
    return load_string(buffer.str(), canonical_path.string(), options);
}
