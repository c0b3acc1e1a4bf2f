#ifndef PLANRUNNER_CORE_AGENT_AGENT_PROMPT_BUILDER_H
#define PLANRUNNER_CORE_AGENT_AGENT_PROMPT_BUILDER_H

#include "core/plan/dto/Plan.h"
#include "core/task/dto/ActionableItem.h"
#include <string>
#include <vector>

namespace planrunner::core::agent {

/**
 * @brief Prompts handed to the executor by the agent loop
 */
class AgentPromptBuilder {
public:
    /**
     * @brief Prompt for a single step or task
     */
    static std::string buildItemPrompt(const plan::Plan& plan, const task::ActionableItem& item);

    /**
     * @brief Prompt for a batch round over every incomplete task
     *
     * Asks the executor to finish with {"completedTaskIndices":[...]}.
     */
    static std::string buildBatchPrompt(const plan::Plan& plan, const std::vector<task::IncompleteTask>& tasks);

private:
    static void appendPlanContext(std::string& out, const plan::Plan& plan);
};

} // namespace planrunner::core::agent

#endif // PLANRUNNER_CORE_AGENT_AGENT_PROMPT_BUILDER_H
