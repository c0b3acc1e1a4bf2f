#include "core/review/core/ReviewPromptBuilder.h"
#include <sstream>

namespace planrunner::core::review {

std::string ReviewPromptBuilder::build(const plan::Plan& plan, const std::vector<size_t>& taskIndices) {
    std::ostringstream out;
    out << "Review the code changes made for plan " << plan.id << ": " << plan.displayTitle() << "\n\n";
    if (!plan.goal.empty()) {
        out << "## Goal\n" << plan.goal << "\n\n";
    }
    if (!plan.details.empty()) {
        out << "## Details\n" << plan.details << "\n\n";
    }

    out << "## Tasks under review\n";
    for (size_t index : taskIndices) {
        const auto& task = plan.tasks.at(index);
        out << "\n### Task " << index << ": " << task.title << (task.isComplete() ? " (done)" : "") << "\n";
        if (!task.description.empty()) {
            out << task.description << "\n";
        }
        if (!task.files.empty()) {
            out << "Files:\n";
            for (const auto& file : task.files) {
                out << "- " << file << "\n";
            }
        }
        for (size_t s = 0; s < task.steps.size(); ++s) {
            out << "- [" << (task.steps[s].done ? "x" : " ") << "] " << task.steps[s].prompt << "\n";
        }
    }

    out << "\n## Output format\n"
        << "Do not modify any files. Reply with a single JSON object and nothing else:\n"
        << "{\"issues\":[{\"severity\":\"critical|major|minor|info\","
        << "\"category\":\"security|performance|bug|style|compliance|testing|other\","
        << "\"content\":\"...\",\"file\":\"path or null\",\"line\":123,\"suggestion\":\"...\"}],"
        << "\"recommendations\":[\"...\"],\"actionItems\":[\"...\"]}\n";
    return out.str();
}

} // namespace planrunner::core::review
