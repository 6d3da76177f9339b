/**
 * @file workflow_definition.hpp
 * @brief Schema types for a deserialized workflow document and its validation.
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief The only workflow document version accepted by this build.
 */
inline constexpr const char* kSupportedWorkflowVersion = "1";

/**
 * @brief One entry of the `steps` list of a workflow document.
 */
struct StepDefinition
{
    std::string name;
    std::string command;
    std::vector<std::string> depends_on;
};

/**
 * @brief In-memory form of a workflow document.
 *
 * @details
 * This is the data contract between deserialization and the scheduler. It is
 * plain data: nothing is checked until `validate_workflow_definition()` runs.
 * Step order is significant; it is the scheduler's tie-break order.
 */
struct WorkflowDefinition
{
    std::string version;
    std::map<std::string, std::string> metadata;
    std::vector<StepDefinition> steps;
};

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of a workflow validation issue.
 */
enum class ValidationCategory
{
    UnsupportedVersion,     ///< `version` is not kSupportedWorkflowVersion.
    DuplicateStepName,      ///< Two steps share a name.
    DanglingDependency,     ///< A `depends_on` entry names no step.
    EmptyStepName,          ///< A step has a blank name.
    EmptyCommand            ///< A step's command has no executable token.
};

const char* to_string(ValidationCategory category) noexcept;

/**
 * @brief A single validation issue.
 */
struct ValidationIssue
{
    ValidationCategory category;
    std::string message;

    /// Names of the steps involved in this issue, in document order.
    std::vector<std::string> involved_steps;
};

// ============================================================================
// WorkflowDiagnostics
// ============================================================================

/**
 * @brief Every constraint violation found in a WorkflowDefinition.
 *
 * @details
 * Validation does not stop at the first problem; all issues are collected so a
 * user can fix a document in one pass.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once populated, the data is immutable; concurrent reads are safe.
 */
class WorkflowDiagnostics
{
public:
    bool is_valid() const noexcept
    {
        return m_issues.empty();
    }

    const std::vector<ValidationIssue>& issues() const noexcept
    {
        return m_issues;
    }

    /**
     * @brief Check whether at least one issue of the given category exists.
     */
    bool has(ValidationCategory category) const noexcept;

    /**
     * @brief Render all issues as a multi-line message.
     */
    std::string describe() const;

    void add(ValidationCategory category,
             std::string message,
             std::vector<std::string> involved_steps = {});

private:
    std::vector<ValidationIssue> m_issues;
};

/**
 * @brief Exception thrown when a workflow definition fails validation.
 */
class WorkflowValidationError : public std::runtime_error
{
public:
    explicit WorkflowValidationError(std::shared_ptr<const WorkflowDiagnostics> diagnostics)
        : std::runtime_error("Invalid workflow definition:\n" + diagnostics->describe())
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<const WorkflowDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<const WorkflowDiagnostics> m_diagnostics;
};

/**
 * @brief Check a definition against every load-time constraint.
 * @return Diagnostics listing every violation; empty when the definition is valid.
 * @note Cycles in `depends_on` are not diagnosed.
 */
std::shared_ptr<const WorkflowDiagnostics> validate_workflow_definition(
    const WorkflowDefinition& definition);

/**
 * @brief Validate and throw on the first invalid definition.
 * @throws WorkflowValidationError listing every issue.
 */
void ensure_valid(const WorkflowDefinition& definition);

/**
 * @brief Split a command line on whitespace.
 * @details The first token is the executable, the rest are its arguments.
 *          No quoting, escaping or expansion is performed.
 */
std::vector<std::string> split_command(const std::string& command);

} // namespace stepflow
