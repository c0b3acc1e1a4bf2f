#ifndef PLANRUNNER_EXECUTOR_EXECUTOR_FACTORY_HPP
#define PLANRUNNER_EXECUTOR_EXECUTOR_FACTORY_HPP

#include "planrunner/executor/IExecutor.hpp"
#include "core/config/PlanRunnerConfig.h"
#include <memory>
#include <string>
#include <vector>

namespace planrunner {
namespace executor {

/**
 * @brief Builds executors from the executors.* configuration
 */
class ExecutorFactory {
public:
    explicit ExecutorFactory(config::PlanRunnerConfig config);

    std::shared_ptr<IExecutor> create(ExecutorKind kind) const;

    /**
     * @throws std::invalid_argument for an unknown executor name
     */
    std::shared_ptr<IExecutor> create(const std::string& name) const;

    std::shared_ptr<IExecutor> createDefault() const;

    /**
     * @brief Executors for "claude-code", "codex-cli" or "both"
     * @throws std::invalid_argument for any other selection
     */
    std::vector<std::shared_ptr<IExecutor>> createForReview(const std::string& selection) const;

private:
    config::PlanRunnerConfig config_;
};

} // namespace executor
} // namespace planrunner

#endif // PLANRUNNER_EXECUTOR_EXECUTOR_FACTORY_HPP
