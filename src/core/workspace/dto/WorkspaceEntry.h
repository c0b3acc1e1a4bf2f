#ifndef PLANRUNNER_CORE_WORKSPACE_WORKSPACE_ENTRY_H
#define PLANRUNNER_CORE_WORKSPACE_WORKSPACE_ENTRY_H

#include "core/util/FileUtils.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace planrunner::core::workspace {

/**
 * @brief One workspace in the registry file
 *
 * Keyed by the normalized absolute workspace path. The branch is not stored;
 * it is queried live when entries are listed.
 */
struct WorkspaceEntry {
    std::string workspacePath;
    std::optional<std::string> taskId;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> repositoryId;
    std::optional<std::string> repositoryUrl;
    std::optional<std::string> originalPlanFilePath;
    std::optional<int> planId;
    std::optional<std::string> planTitle;
    std::vector<std::string> issueUrls;
    std::optional<std::string> createdAt;
    std::optional<std::string> updatedAt;
};

/**
 * @brief Tri-state field of a metadata patch
 *
 * UNSET leaves the stored value alone, CLEAR removes it, VALUE replaces it.
 */
template<typename T>
class FieldPatch {
public:
    enum class Mode {
        UNSET,
        CLEAR,
        VALUE
    };

    FieldPatch() = default;

    static FieldPatch clear() {
        FieldPatch patch;
        patch.mode_ = Mode::CLEAR;
        return patch;
    }

    static FieldPatch set(T value) {
        FieldPatch patch;
        patch.mode_ = Mode::VALUE;
        patch.value_ = std::move(value);
        return patch;
    }

    Mode mode() const { return mode_; }
    bool isUnset() const { return mode_ == Mode::UNSET; }
    bool isClear() const { return mode_ == Mode::CLEAR; }
    bool hasValue() const { return mode_ == Mode::VALUE; }

    const T& value() const {
        if (mode_ != Mode::VALUE) {
            throw std::logic_error("FieldPatch has no value");
        }
        return *value_;
    }

    void applyTo(std::optional<T>& field) const {
        if (mode_ == Mode::CLEAR) {
            field.reset();
        } else if (mode_ == Mode::VALUE) {
            field = *value_;
        }
    }

private:
    Mode mode_{Mode::UNSET};
    std::optional<T> value_;
};

/**
 * @brief Command-line style text: absent = UNSET, "" = CLEAR, otherwise VALUE
 */
inline FieldPatch<std::string> patchFromText(const std::optional<std::string>& text) {
    if (!text) {
        return {};
    }
    if (text->empty()) {
        return FieldPatch<std::string>::clear();
    }
    return FieldPatch<std::string>::set(*text);
}

/**
 * @brief Partial update of a registry entry
 *
 * An issueUrls patch holding an empty list is a clear.
 */
struct WorkspaceMetadataPatch {
    FieldPatch<std::string> taskId;
    FieldPatch<std::string> name;
    FieldPatch<std::string> description;
    FieldPatch<std::string> repositoryId;
    FieldPatch<std::string> repositoryUrl;
    FieldPatch<std::string> originalPlanFilePath;
    FieldPatch<int> planId;
    FieldPatch<std::string> planTitle;
    FieldPatch<std::vector<std::string>> issueUrls;
    bool stampCreatedAt{false};    // set createdAt when the patch creates the entry
};

/**
 * @brief Registry entry with live state, as returned by listEntries()
 */
struct WorkspaceListEntry {
    WorkspaceEntry entry;
    util::PathState state{util::PathState::DIRECTORY};   // DIRECTORY or UNKNOWN
    std::string stateMessage;                            // stat error text for UNKNOWN
    std::string branch;                                  // empty if unknown
};

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_WORKSPACE_ENTRY_H
