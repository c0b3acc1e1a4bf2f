#include "core/agent/util/AgentPromptBuilder.h"

namespace planrunner::core::agent {

void AgentPromptBuilder::appendPlanContext(std::string& out, const plan::Plan& plan) {
    out += "# Plan " + std::to_string(plan.id) + ": " + plan.displayTitle() + "\n\n";
    if (!plan.goal.empty()) {
        out += "## Goal\n" + plan.goal + "\n\n";
    }
    if (!plan.details.empty()) {
        out += "## Details\n" + plan.details + "\n\n";
    }
    if (!plan.filename.empty()) {
        out += "Plan file: " + plan.filename + "\n\n";
    }
}

std::string AgentPromptBuilder::buildItemPrompt(const plan::Plan& plan, const task::ActionableItem& item) {
    std::string out;
    appendPlanContext(out, plan);

    const auto& task = plan.tasks.at(item.taskIndex);
    out += "## Current task: " + task.title + "\n";
    if (!task.description.empty()) {
        out += task.description + "\n";
    }
    if (!task.files.empty()) {
        out += "\nRelevant files:\n";
        for (const auto& file : task.files) {
            out += "- " + file + "\n";
        }
    }

    if (item.kind == task::ActionableItem::Kind::STEP) {
        out += "\n## Step " + std::to_string(item.stepIndex + 1) + " of " + std::to_string(task.steps.size()) +
               "\n" + task.steps.at(item.stepIndex).prompt + "\n";
        out += "\nImplement only this step.\n";
    } else {
        out += "\nImplement this task.\n";
    }
    return out;
}

std::string AgentPromptBuilder::buildBatchPrompt(const plan::Plan& plan,
                                                 const std::vector<task::IncompleteTask>& tasks) {
    std::string out;
    appendPlanContext(out, plan);

    out += "## Incomplete tasks\n";
    for (const auto& incomplete : tasks) {
        const auto& task = incomplete.task;
        out += "\n### Task " + std::to_string(incomplete.taskIndex) + ": " + task.title + "\n";
        if (!task.description.empty()) {
            out += task.description + "\n";
        }
        for (const auto& step : task.steps) {
            out += std::string("- [") + (step.done ? "x" : " ") + "] " + step.prompt + "\n";
        }
    }

    out += "\nPick the tasks that belong together and implement them. Do not edit the plan file.\n"
           "When you are finished, end your reply with a JSON object listing the zero-based indexes "
           "of the tasks you completed, for example:\n"
           "{\"completedTaskIndices\":[0,2]}\n";
    return out;
}

} // namespace planrunner::core::agent
