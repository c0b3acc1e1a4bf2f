#ifndef PLANRUNNER_CORE_PLAN_PLAN_SERIALIZER_H
#define PLANRUNNER_CORE_PLAN_PLAN_SERIALIZER_H

#include "core/plan/dto/Plan.h"
#include <filesystem>
#include <string>

namespace planrunner::core::plan {

/**
 * @brief Plan file codec (yaml-cpp)
 *
 * Two layouts are accepted:
 * - "*.plan.md": YAML front matter between "---" lines, markdown body = details
 * - "*.yml" / "*.yaml": the same keys as a plain YAML document, details as a key
 */
class PlanSerializer {
public:
    /**
     * @brief Parse a plan file
     *
     * @param text file contents
     * @param path file path, used for the layout choice and error messages
     * @throws ValidationException naming the file and the offending field
     */
    static Plan parse(const std::string& text, const std::filesystem::path& path);

    /**
     * @brief Render a plan in the layout matching its path
     *
     * Keys are emitted in a fixed order; empty optional fields are omitted.
     */
    static std::string serialize(const Plan& plan, const std::filesystem::path& path);

    /**
     * @brief True for "*.plan.md", "*.yml" and "*.yaml"
     */
    static bool isPlanFile(const std::filesystem::path& path);

    static bool isMarkdownLayout(const std::filesystem::path& path);
};

} // namespace planrunner::core::plan

#endif // PLANRUNNER_CORE_PLAN_PLAN_SERIALIZER_H
