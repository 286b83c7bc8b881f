#pragma once

// ---------------------------------------------------------------------------
// rule_registry.hpp
//
// scope 별로 활성 RuleSet 스냅샷을 보관하고 원자적으로 교체하는 레지스트리.
//
// [동시성 모델]
// - 스냅샷 테이블 전체를 std::atomic<std::shared_ptr<const SnapshotTable>> 로
//   보관한다. 읽기(current)는 load() 한 번으로 끝나며 락을 잡지 않는다.
// - 쓰기(activate / load_all / reload_all)는 writer_mutex_ 로 직렬화한 뒤
//   테이블을 복사·수정하여 store() 로 교체한다 (copy-on-write).
// - 진행 중인 요청은 처음 취득한 RuleSetPtr 을 끝까지 사용한다.
//   교체 이후에도 shared_ptr 참조 카운트가 이전 스냅샷 수명을 유지한다.
//   따라서 요청은 "완전히 이전" 또는 "완전히 새" 스냅샷만 관찰한다.
//
// [Fail-close]
// - 로드 실패(ConfigError) 시 해당 scope 의 이전 스냅샷을 그대로 유지한다.
// - current() 가 nullptr 을 반환하면 pipeline 은 반드시 Block 처리한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "common/types.hpp"         // Scope, ConfigError, RuleError
#include "policy/ruleset_loader.hpp"  // LoaderOptions, LoadResult

// ---------------------------------------------------------------------------
// RulesetSource
//   설정 파일에 나열된 규칙 파일 하나와 그 파일이 담당하는 scope.
// ---------------------------------------------------------------------------
struct RulesetSource {
    std::filesystem::path path{};
    Scope                 scope{};
};

// ---------------------------------------------------------------------------
// ReloadReport
//   load_all / reload_all 의 결과 요약 (운영자 보고용).
// ---------------------------------------------------------------------------
struct ReloadReport {
    std::size_t              activated{0};     // 새로 활성화된 스냅샷 수
    std::size_t              kept_previous{0}; // 실패로 이전 스냅샷을 유지한 scope 수
    std::vector<ConfigError> config_errors{};
    std::vector<RuleError>   rule_errors{};
};

// ---------------------------------------------------------------------------
// RuleRegistry
//
//   [스레드 안전성]
//   - current: 여러 스레드에서 동시 호출 안전 (lock-free 읽기).
//   - activate / load_all / reload_all: 동시 호출 안전 (내부 mutex).
// ---------------------------------------------------------------------------
class RuleRegistry {
public:
    explicit RuleRegistry(LoaderOptions options = {});

    ~RuleRegistry() = default;

    // 복사/이동 금지 (atomic 멤버, 요청 경로에서 참조로 공유)
    RuleRegistry(const RuleRegistry&)            = delete;
    RuleRegistry& operator=(const RuleRegistry&) = delete;
    RuleRegistry(RuleRegistry&&)                 = delete;
    RuleRegistry& operator=(RuleRegistry&&)      = delete;

    // load
    //   규칙 파일 하나를 로드·검증한다. 활성화하지 않는다.
    [[nodiscard]] std::expected<LoadResult, ConfigError>
    load(const std::filesystem::path& path) const;

    // activate
    //   scope 키에 스냅샷을 원자적으로 설치하고 설치된 핸들을 반환한다.
    //   ruleset 이 nullptr 이면 설치하지 않고 기존 핸들(없으면 nullptr)을 반환한다.
    RuleSetPtr activate(const Scope& scope, RuleSetPtr ruleset);

    // current
    //   요청 scope 에 가장 잘 맞는 스냅샷을 반환한다.
    //
    //   [매칭 규칙]
    //   - 키의 비어있지 않은 필드가 모두 요청 값과 같아야 후보가 된다
    //     (country 대소문자 무관, language/domain 대소문자 무관).
    //   - 후보 중 구체도(domain=4, country=2, language=1 가중 합)가 가장 높은 것.
    //   - 빈 키 {} 는 기본값 (구체도 0) 으로 항상 후보가 된다.
    //   - 후보가 없으면 nullptr.
    [[nodiscard]] RuleSetPtr current(const Scope& scope) const;

    // load_all
    //   sources 를 기억하고 모두 로드하여 한 번의 swap 으로 설치한다.
    //   설치되는 테이블은 sources 의 scope 만 담는다 (이전 activate 결과 포함 교체).
    //   실패한 파일의 scope 는 이전 스냅샷이 있으면 그것을 유지한다.
    ReloadReport load_all(std::vector<RulesetSource> sources);

    // reload_all
    //   마지막 load_all 에 전달된 sources 를 다시 읽는다 (SIGHUP 등).
    ReloadReport reload_all();

    // size: 현재 설치된 스냅샷 수
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }

private:
    using SnapshotTable = std::map<Scope, RuleSetPtr>;

    LoaderOptions options_;

    std::atomic<std::shared_ptr<const SnapshotTable>> table_;

    // writer 직렬화. sources_ 도 이 mutex 로 보호한다.
    std::mutex                 writer_mutex_;
    std::vector<RulesetSource> sources_{};

    ReloadReport load_locked(const std::vector<RulesetSource>& sources);
};

// scope 키 정규화: country 대문자, language/domain 소문자.
[[nodiscard]] Scope normalize_scope(const Scope& scope);
