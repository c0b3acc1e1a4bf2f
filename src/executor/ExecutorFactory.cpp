#include "planrunner/executor/ExecutorFactory.hpp"
#include "planrunner/executor/SubprocessExecutor.hpp"
#include <stdexcept>

namespace planrunner {
namespace executor {

ExecutorFactory::ExecutorFactory(config::PlanRunnerConfig config) : config_(std::move(config)) {}

std::shared_ptr<IExecutor> ExecutorFactory::create(ExecutorKind kind) const {
    return std::make_shared<SubprocessExecutor>(kind, config_.executorSettings(executorKindToString(kind)));
}

std::shared_ptr<IExecutor> ExecutorFactory::create(const std::string& name) const {
    auto kind = executorKindFromString(name);
    if (!kind) {
        throw std::invalid_argument("Unknown executor '" + name + "' (expected claude-code or codex-cli)");
    }
    return create(*kind);
}

std::shared_ptr<IExecutor> ExecutorFactory::createDefault() const {
    return create(config_.defaultExecutor);
}

std::vector<std::shared_ptr<IExecutor>> ExecutorFactory::createForReview(const std::string& selection) const {
    std::vector<std::shared_ptr<IExecutor>> executors;
    for (auto kind : parseReviewExecutorSelection(selection)) {
        executors.push_back(create(kind));
    }
    return executors;
}

} // namespace executor
} // namespace planrunner
