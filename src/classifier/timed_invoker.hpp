#pragma once

// ---------------------------------------------------------------------------
// timed_invoker.hpp
//
// 외부 classifier / model 호출을 명시적 timeout 과 함께 실행한다.
//
// [동작]
// 호출을 Boost.Asio thread_pool 에 post 하고 호출 스레드는 future 를
// timeout 만큼만 기다린다. timeout 초과 시 kTimeout 을 즉시 반환한다.
// 늦게 끝난 호출의 결과는 버려진다 (실행 중인 호출을 강제 중단하지는 않는다).
// timeout 시점에 아직 시작하지 않은 작업은 capability 를 호출하지 않고 끝난다.
//
// [수명]
// 작업은 capability 의 shared_ptr 과 텍스트 사본을 보관하므로 timeout 이후에도
// 댕글링 참조가 생기지 않는다. 소멸자는 pool 의 남은 작업을 join 한다.
//
// [오류 변환]
//   capability 미주입        → kUnavailable
//   unexpected 반환 / 예외   → kFailure
//   timeout 초과             → kTimeout
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "classifier/capability.hpp"
#include "common/types.hpp"

class TimedInvoker {
public:
    explicit TimedInvoker(std::size_t threads = 2);
    ~TimedInvoker();

    TimedInvoker(const TimedInvoker&)            = delete;
    TimedInvoker& operator=(const TimedInvoker&) = delete;

    [[nodiscard]] std::expected<std::vector<ClassifierVerdict>, ExternalError>
    classify(std::shared_ptr<ExternalClassifier> classifier,
             std::string                         text,
             std::chrono::milliseconds           timeout);

    [[nodiscard]] std::expected<std::string, ExternalError>
    generate(std::shared_ptr<ExternalModel> model,
             std::string                    text,
             std::string                    system_prompt,
             std::chrono::milliseconds      timeout);

private:
    template <typename T, typename Call>
    std::expected<T, ExternalError> run(const char* capability, Call call,
                                        std::chrono::milliseconds timeout);

    boost::asio::thread_pool pool_;
};
