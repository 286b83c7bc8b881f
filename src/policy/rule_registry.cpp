// ---------------------------------------------------------------------------
// rule_registry.cpp
//
// scope 별 RuleSet 스냅샷의 로드/설치/조회.
//
// [Hot Reload]
// 테이블 전체를 복사한 뒤 수정하고 std::atomic<shared_ptr>::store 로 교체한다.
// current() 는 load() 한 번으로 테이블을 얻으므로 writer 와 경쟁하지 않는다.
//
// [중복 scope]
// 같은 scope 키로 두 파일이 설정되면 두 번째 파일은 kDuplicateScope 로
// 거부된다. 먼저 나열된 파일이 유지된다.
// ---------------------------------------------------------------------------

#include "policy/rule_registry.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[nodiscard]] std::string uppered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

[[nodiscard]] std::string describe(const Scope& scope) {
    if (scope.empty()) {
        return "<default>";
    }
    return fmt::format("country={},language={},domain={}",
                       scope.country.empty()  ? "*" : scope.country,
                       scope.language.empty() ? "*" : scope.language,
                       scope.domain.empty()   ? "*" : scope.domain);
}

// 키가 요청을 포괄하면 구체도 점수, 아니면 -1
[[nodiscard]] int specificity(const Scope& key, const Scope& request) {
    int score = 0;
    if (!key.domain.empty()) {
        if (key.domain != request.domain) {
            return -1;
        }
        score += 4;
    }
    if (!key.country.empty()) {
        if (key.country != request.country) {
            return -1;
        }
        score += 2;
    }
    if (!key.language.empty()) {
        if (key.language != request.language) {
            return -1;
        }
        score += 1;
    }
    return score;
}

}  // namespace

Scope normalize_scope(const Scope& scope) {
    return Scope{uppered(scope.country), lowered(scope.language), lowered(scope.domain)};
}

// ---------------------------------------------------------------------------
// RuleRegistry 생성자
// ---------------------------------------------------------------------------
RuleRegistry::RuleRegistry(LoaderOptions options)
    : options_(std::move(options))
    , table_(std::make_shared<const SnapshotTable>()) {}

std::expected<LoadResult, ConfigError>
RuleRegistry::load(const std::filesystem::path& path) const {
    return RuleSetLoader::load(path, options_);
}

// ---------------------------------------------------------------------------
// activate: copy-on-write 교체
// ---------------------------------------------------------------------------
RuleSetPtr RuleRegistry::activate(const Scope& scope, RuleSetPtr ruleset) {
    const Scope key = normalize_scope(scope);
    const std::lock_guard<std::mutex> lock(writer_mutex_);

    const auto old_table = table_.load();
    if (!ruleset) {
        spdlog::warn("rule_registry: activate called with nullptr ruleset for {}, "
                     "keeping current snapshot", describe(key));
        const auto it = old_table->find(key);
        return it == old_table->end() ? nullptr : it->second;
    }

    auto new_table = std::make_shared<SnapshotTable>(*old_table);
    (*new_table)[key] = ruleset;
    table_.store(std::move(new_table));

    spdlog::info("rule_registry: activated ruleset version={} for {} ({} rules)",
                 ruleset->version, describe(key), ruleset->rules.size());
    return ruleset;
}

// ---------------------------------------------------------------------------
// current: lock-free 조회
// ---------------------------------------------------------------------------
RuleSetPtr RuleRegistry::current(const Scope& scope) const {
    const Scope request = normalize_scope(scope);
    const auto  table   = table_.load();

    RuleSetPtr best{};
    int        best_score = -1;
    for (const auto& [key, snapshot] : *table) {
        const int score = specificity(key, request);
        if (score > best_score) {
            best_score = score;
            best       = snapshot;
        }
    }

    if (!best) {
        spdlog::debug("rule_registry: no snapshot for {}", describe(request));
    }
    return best;
}

std::size_t RuleRegistry::size() const {
    return table_.load()->size();
}

ReloadReport RuleRegistry::load_all(std::vector<RulesetSource> sources) {
    const std::lock_guard<std::mutex> lock(writer_mutex_);
    sources_ = std::move(sources);
    return load_locked(sources_);
}

ReloadReport RuleRegistry::reload_all() {
    const std::lock_guard<std::mutex> lock(writer_mutex_);
    spdlog::info("rule_registry: reloading {} ruleset sources", sources_.size());
    return load_locked(sources_);
}

// ---------------------------------------------------------------------------
// load_locked
//   모든 source 를 로드한 뒤 한 번의 store() 로 설치한다.
//   호출자는 writer_mutex_ 를 잡고 있어야 한다.
// ---------------------------------------------------------------------------
ReloadReport RuleRegistry::load_locked(const std::vector<RulesetSource>& sources) {
    ReloadReport report{};

    // 새 테이블은 sources 만으로 구성한다. 목록에서 빠진 scope 는 제거된다.
    const auto old_table = table_.load();
    auto       new_table = std::make_shared<SnapshotTable>();

    std::set<Scope> seen;
    for (const auto& source : sources) {
        const Scope key = normalize_scope(source.scope);

        if (!seen.insert(key).second) {
            ConfigError err{
                ConfigErrorCode::kDuplicateScope,
                fmt::format("scope {} already configured by an earlier file", describe(key)),
                source.path.string()};
            spdlog::error("rule_registry: {} ({})", err.message, err.context);
            report.config_errors.push_back(std::move(err));
            continue;
        }

        auto loaded = RuleSetLoader::load(source.path, options_);
        if (!loaded) {
            if (const auto previous = old_table->find(key); previous != old_table->end()) {
                (*new_table)[key] = previous->second;
                ++report.kept_previous;
                spdlog::warn("rule_registry: keeping previous snapshot for {} after load failure",
                             describe(key));
            }
            report.config_errors.push_back(std::move(loaded.error()));
            continue;
        }

        for (auto& rule_error : loaded->rule_errors) {
            report.rule_errors.push_back(std::move(rule_error));
        }
        (*new_table)[key] = std::move(loaded->ruleset);
        ++report.activated;
    }

    table_.store(std::move(new_table));

    spdlog::info("rule_registry: {} snapshots activated, {} kept previous, "
                 "{} configuration errors, {} rule errors",
                 report.activated, report.kept_previous,
                 report.config_errors.size(), report.rule_errors.size());
    return report;
}
