#include "core/plan/util/PlanSerializer.h"
#include "core/error/Exceptions.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <sstream>

namespace planrunner::core::plan {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct FrontMatter {
    std::string yaml;
    std::string body;
};

// Splits "---\n<yaml>\n---\n<body>"; the body loses one leading blank line.
FrontMatter splitFrontMatter(const std::string& text, const std::string& path) {
    std::istringstream in(text);
    std::string line;

    if (!std::getline(in, line) || (line != "---" && line != "---\r")) {
        throw ValidationException(path + ": missing front matter (file must start with '---')");
    }

    FrontMatter result;
    bool closed = false;
    while (std::getline(in, line)) {
        if (line == "---" || line == "---\r") {
            closed = true;
            break;
        }
        result.yaml += line;
        result.yaml += '\n';
    }
    if (!closed) {
        throw ValidationException(path + ": unterminated front matter");
    }

    std::ostringstream body;
    body << in.rdbuf();
    result.body = body.str();
    if (result.body.rfind("\n", 0) == 0) {
        result.body.erase(0, 1);
    }
    while (!result.body.empty() && (result.body.back() == '\n' || result.body.back() == '\r')) {
        result.body.pop_back();
    }
    return result;
}

std::string scalarString(const YAML::Node& node, const std::string& key, const std::string& path) {
    if (!node[key] || node[key].IsNull()) {
        return "";
    }
    if (!node[key].IsScalar()) {
        throw ValidationException(path + ": '" + key + "' must be a string");
    }
    return node[key].as<std::string>();
}

int positiveInt(const YAML::Node& node, const std::string& field, const std::string& path) {
    int value = 0;
    try {
        value = node.as<int>();
    } catch (const YAML::Exception&) {
        throw ValidationException(path + ": '" + field + "' must be an integer");
    }
    if (value <= 0) {
        throw ValidationException(path + ": '" + field + "' must be a positive integer, got " +
                                  std::to_string(value));
    }
    return value;
}

bool boolField(const YAML::Node& node, const std::string& key, const std::string& path) {
    if (!node[key]) {
        return false;
    }
    try {
        return node[key].as<bool>();
    } catch (const YAML::Exception&) {
        throw ValidationException(path + ": '" + key + "' must be a boolean");
    }
}

std::vector<std::string> stringList(const YAML::Node& node, const std::string& key, const std::string& path) {
    std::vector<std::string> values;
    if (!node[key] || node[key].IsNull()) {
        return values;
    }
    if (!node[key].IsSequence()) {
        throw ValidationException(path + ": '" + key + "' must be a list");
    }
    for (const auto& item : node[key]) {
        if (!item.IsScalar()) {
            throw ValidationException(path + ": '" + key + "' entries must be strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

Task parseTask(const YAML::Node& node, size_t index, const std::string& path) {
    const std::string where = path + ": tasks[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        throw ValidationException(where + " must be a mapping");
    }

    Task task;
    task.title = scalarString(node, "title", where);
    if (task.title.empty()) {
        throw ValidationException(where + " has no title");
    }
    task.description = scalarString(node, "description", where);
    task.files = stringList(node, "files", where);
    task.done = boolField(node, "done", where);

    if (node["steps"] && !node["steps"].IsNull()) {
        if (!node["steps"].IsSequence()) {
            throw ValidationException(where + ": 'steps' must be a list");
        }
        size_t stepIndex = 0;
        for (const auto& stepNode : node["steps"]) {
            const std::string stepWhere = where + ".steps[" + std::to_string(stepIndex++) + "]";
            if (!stepNode.IsMap()) {
                throw ValidationException(stepWhere + " must be a mapping");
            }
            Step step;
            step.prompt = scalarString(stepNode, "prompt", stepWhere);
            step.done = boolField(stepNode, "done", stepWhere);
            task.steps.push_back(std::move(step));
        }
    }
    return task;
}

Plan parseDocument(const YAML::Node& root, const std::string& path) {
    if (!root.IsMap()) {
        throw ValidationException(path + ": plan metadata must be a mapping");
    }
    if (!root["id"]) {
        throw ValidationException(path + ": missing required field 'id'");
    }

    Plan plan;
    plan.id = positiveInt(root["id"], "id", path);
    plan.uuid = scalarString(root, "uuid", path);
    plan.title = scalarString(root, "title", path);
    plan.goal = scalarString(root, "goal", path);
    plan.details = scalarString(root, "details", path);
    // Literal blocks keep their final line break
    while (!plan.details.empty() && plan.details.back() == '\n') {
        plan.details.pop_back();
    }

    if (root["status"]) {
        const std::string text = scalarString(root, "status", path);
        auto status = planStatusFromString(text);
        if (!status) {
            throw ValidationException(path + ": unknown status '" + text + "'");
        }
        plan.status = *status;
    }

    if (root["priority"] && !root["priority"].IsNull()) {
        const std::string text = scalarString(root, "priority", path);
        auto priority = planPriorityFromString(text);
        if (!priority) {
            throw ValidationException(path + ": unknown priority '" + text + "'");
        }
        plan.priority = *priority;
    }

    if (root["dependencies"] && !root["dependencies"].IsNull()) {
        if (!root["dependencies"].IsSequence()) {
            throw ValidationException(path + ": 'dependencies' must be a list");
        }
        for (const auto& dep : root["dependencies"]) {
            int depId = positiveInt(dep, "dependencies", path);
            if (std::find(plan.dependencies.begin(), plan.dependencies.end(), depId) == plan.dependencies.end()) {
                plan.dependencies.push_back(depId);
            }
        }
    }

    if (root["parent"] && !root["parent"].IsNull()) {
        plan.parent = positiveInt(root["parent"], "parent", path);
    }
    if (root["discoveredFrom"] && !root["discoveredFrom"].IsNull()) {
        plan.discoveredFrom = positiveInt(root["discoveredFrom"], "discoveredFrom", path);
    }

    plan.epic = boolField(root, "epic", path);
    plan.tags = normalizeTags(stringList(root, "tags", path));

    const std::string branch = scalarString(root, "branch", path);
    if (!branch.empty()) {
        plan.branch = branch;
    }

    plan.createdAt = scalarString(root, "createdAt", path);
    plan.updatedAt = scalarString(root, "updatedAt", path);

    if (root["tasks"] && !root["tasks"].IsNull()) {
        if (!root["tasks"].IsSequence()) {
            throw ValidationException(path + ": 'tasks' must be a list");
        }
        size_t index = 0;
        for (const auto& taskNode : root["tasks"]) {
            plan.tasks.push_back(parseTask(taskNode, index++, path));
        }
    }

    return plan;
}

void emitString(YAML::Emitter& out, const std::string& key, const std::string& value) {
    out << YAML::Key << key << YAML::Value;
    if (value.find('\n') != std::string::npos) {
        out << YAML::Literal << value;
    } else {
        out << value;
    }
}

} // namespace

bool PlanSerializer::isMarkdownLayout(const std::filesystem::path& path) {
    return endsWith(path.filename().string(), ".plan.md");
}

bool PlanSerializer::isPlanFile(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return endsWith(name, ".plan.md") || endsWith(name, ".yml") || endsWith(name, ".yaml");
}

Plan PlanSerializer::parse(const std::string& text, const std::filesystem::path& path) {
    const std::string where = path.string();

    try {
        if (isMarkdownLayout(path)) {
            auto parts = splitFrontMatter(text, where);
            Plan plan = parseDocument(YAML::Load(parts.yaml), where);
            if (!parts.body.empty()) {
                plan.details = parts.body;
            }
            return plan;
        }
        return parseDocument(YAML::Load(text), where);
    } catch (const YAML::Exception& e) {
        throw ValidationException(where + ": invalid YAML: " + e.what());
    }
}

std::string PlanSerializer::serialize(const Plan& plan, const std::filesystem::path& path) {
    const bool markdown = isMarkdownLayout(path);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << plan.id;
    if (!plan.uuid.empty()) {
        out << YAML::Key << "uuid" << YAML::Value << plan.uuid;
    }
    if (!plan.title.empty()) {
        emitString(out, "title", plan.title);
    }
    if (!plan.goal.empty()) {
        emitString(out, "goal", plan.goal);
    }
    out << YAML::Key << "status" << YAML::Value << planStatusToString(plan.status);
    if (plan.priority) {
        out << YAML::Key << "priority" << YAML::Value << planPriorityToString(*plan.priority);
    }
    if (!plan.dependencies.empty()) {
        out << YAML::Key << "dependencies" << YAML::Value << YAML::Flow << plan.dependencies;
    }
    if (plan.parent) {
        out << YAML::Key << "parent" << YAML::Value << *plan.parent;
    }
    if (plan.discoveredFrom) {
        out << YAML::Key << "discoveredFrom" << YAML::Value << *plan.discoveredFrom;
    }
    if (plan.epic) {
        out << YAML::Key << "epic" << YAML::Value << true;
    }
    if (!plan.tags.empty()) {
        out << YAML::Key << "tags" << YAML::Value << YAML::Flow << plan.tags;
    }
    if (plan.branch) {
        out << YAML::Key << "branch" << YAML::Value << *plan.branch;
    }
    if (!plan.createdAt.empty()) {
        out << YAML::Key << "createdAt" << YAML::Value << plan.createdAt;
    }
    if (!plan.updatedAt.empty()) {
        out << YAML::Key << "updatedAt" << YAML::Value << plan.updatedAt;
    }
    if (!markdown && !plan.details.empty()) {
        emitString(out, "details", plan.details);
    }

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto& task : plan.tasks) {
        out << YAML::BeginMap;
        emitString(out, "title", task.title);
        if (!task.description.empty()) {
            emitString(out, "description", task.description);
        }
        if (!task.files.empty()) {
            out << YAML::Key << "files" << YAML::Value << task.files;
        }
        out << YAML::Key << "done" << YAML::Value << task.done;
        if (!task.steps.empty()) {
            out << YAML::Key << "steps" << YAML::Value << YAML::BeginSeq;
            for (const auto& step : task.steps) {
                out << YAML::BeginMap;
                emitString(out, "prompt", step.prompt);
                out << YAML::Key << "done" << YAML::Value << step.done;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        throw ValidationException(path.string() + ": failed to emit YAML: " + out.GetLastError());
    }

    std::string result;
    if (markdown) {
        result = "---\n";
        result += out.c_str();
        result += "\n---\n";
        if (!plan.details.empty()) {
            result += "\n";
            result += plan.details;
            result += "\n";
        }
    } else {
        result = out.c_str();
        result += "\n";
    }
    return result;
}

} // namespace planrunner::core::plan
