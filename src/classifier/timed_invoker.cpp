// ---------------------------------------------------------------------------
// timed_invoker.cpp
// ---------------------------------------------------------------------------

#include "classifier/timed_invoker.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <utility>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

TimedInvoker::TimedInvoker(std::size_t threads)
    : pool_(threads == 0 ? 1 : threads) {}

TimedInvoker::~TimedInvoker() {
    pool_.join();
}

// ---------------------------------------------------------------------------
// run
//   call 은 std::expected<T, std::string> 을 반환하는 nullary callable.
// ---------------------------------------------------------------------------
template <typename T, typename Call>
std::expected<T, ExternalError> TimedInvoker::run(const char*               capability,
                                                  Call                      call,
                                                  std::chrono::milliseconds timeout) {
    using Outcome = std::expected<T, std::string>;

    // timeout 으로 포기한 호출은 아직 큐에 있으면 capability 를 부르지 않고 끝낸다
    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    auto task = std::make_shared<std::packaged_task<Outcome()>>(
        [call = std::move(call), abandoned]() mutable -> Outcome {
            if (abandoned->load(std::memory_order_acquire)) {
                return std::unexpected(std::string("abandoned after timeout"));
            }
            return call();
        });
    auto future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });

    if (future.wait_for(timeout) != std::future_status::ready) {
        abandoned->store(true, std::memory_order_release);
        spdlog::warn("timed_invoker: {} call exceeded {}ms timeout", capability, timeout.count());
        return std::unexpected(ExternalError{
            ExternalErrorCode::kTimeout, capability,
            fmt::format("no response within {}ms", timeout.count())});
    }

    try {
        Outcome outcome = future.get();
        if (!outcome) {
            spdlog::warn("timed_invoker: {} call failed: {}", capability, outcome.error());
            return std::unexpected(ExternalError{
                ExternalErrorCode::kFailure, capability, std::move(outcome.error())});
        }
        return std::move(*outcome);
    } catch (const std::exception& e) {
        spdlog::error("timed_invoker: {} call threw: {}", capability, e.what());
        return std::unexpected(ExternalError{ExternalErrorCode::kFailure, capability, e.what()});
    } catch (...) {
        spdlog::error("timed_invoker: {} call threw a non-standard exception", capability);
        return std::unexpected(ExternalError{
            ExternalErrorCode::kFailure, capability, "non-standard exception"});
    }
}

std::expected<std::vector<ClassifierVerdict>, ExternalError>
TimedInvoker::classify(std::shared_ptr<ExternalClassifier> classifier,
                       std::string                         text,
                       std::chrono::milliseconds           timeout) {
    if (!classifier) {
        return std::unexpected(ExternalError{
            ExternalErrorCode::kUnavailable, "classifier", "no classifier attached"});
    }
    return run<std::vector<ClassifierVerdict>>(
        "classifier",
        [classifier = std::move(classifier), text = std::move(text)]() {
            return classifier->classify(text);
        },
        timeout);
}

std::expected<std::string, ExternalError>
TimedInvoker::generate(std::shared_ptr<ExternalModel> model,
                       std::string                    text,
                       std::string                    system_prompt,
                       std::chrono::milliseconds      timeout) {
    if (!model) {
        return std::unexpected(ExternalError{
            ExternalErrorCode::kUnavailable, "model", "no model attached"});
    }
    return run<std::string>(
        "model",
        [model = std::move(model), text = std::move(text), prompt = std::move(system_prompt)]() {
            return model->generate(text, prompt);
        },
        timeout);
}
