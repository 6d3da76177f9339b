/**
 * @file workflow_definition.cpp
 */
#include "stepflow/common/workflow_definition.hpp"

#include <cctype>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace stepflow
{

const char* to_string(ValidationCategory category) noexcept
{
    switch (category)
    {
        case ValidationCategory::UnsupportedVersion: return "UnsupportedVersion";
        case ValidationCategory::DuplicateStepName: return "DuplicateStepName";
        case ValidationCategory::DanglingDependency: return "DanglingDependency";
        case ValidationCategory::EmptyStepName: return "EmptyStepName";
        case ValidationCategory::EmptyCommand: return "EmptyCommand";
    }
    return "Unknown";
}

bool WorkflowDiagnostics::has(ValidationCategory category) const noexcept
{
    for (const auto& issue : m_issues)
    {
        if (issue.category == category)
        {
            return true;
        }
    }
    return false;
}

std::string WorkflowDiagnostics::describe() const
{
    std::ostringstream oss;
    for (const auto& issue : m_issues)
    {
        oss << "  [" << to_string(issue.category) << "] " << issue.message << "\n";
    }
    return oss.str();
}

void WorkflowDiagnostics::add(ValidationCategory category,
                              std::string message,
                              std::vector<std::string> involved_steps)
{
    m_issues.push_back(ValidationIssue{category, std::move(message), std::move(involved_steps)});
}

// ============================================================================
// Validation
// ============================================================================

std::shared_ptr<const WorkflowDiagnostics> validate_workflow_definition(
    const WorkflowDefinition& definition)
{
    auto diag = std::make_shared<WorkflowDiagnostics>();

    if (definition.version != kSupportedWorkflowVersion)
    {
        diag->add(ValidationCategory::UnsupportedVersion,
                  "Unsupported workflow version '" + definition.version +
                      "'; expected '" + kSupportedWorkflowVersion + "'");
    }

    // First pass: names
    std::unordered_map<std::string, size_t> first_index;
    for (size_t i = 0; i < definition.steps.size(); ++i)
    {
        const auto& step = definition.steps[i];
        if (step.name.empty())
        {
            diag->add(ValidationCategory::EmptyStepName,
                      "Step #" + std::to_string(i) + " has an empty name");
        }
        else
        {
            auto inserted = first_index.emplace(step.name, i);
            if (!inserted.second)
            {
                diag->add(ValidationCategory::DuplicateStepName,
                          "Step name '" + step.name + "' is used by step #" +
                              std::to_string(inserted.first->second) + " and step #" +
                              std::to_string(i),
                          {step.name});
            }
        }

        if (split_command(step.command).empty())
        {
            diag->add(ValidationCategory::EmptyCommand,
                      "Step '" + step.name + "' has no command to execute",
                      {step.name});
        }
    }

    // Second pass: dependency references
    for (const auto& step : definition.steps)
    {
        std::unordered_set<std::string> reported;
        for (const auto& dep : step.depends_on)
        {
            if (first_index.count(dep) == 0 && reported.insert(dep).second)
            {
                diag->add(ValidationCategory::DanglingDependency,
                          "Step '" + step.name + "' depends on unknown step '" + dep + "'",
                          {step.name, dep});
            }
        }
    }

    return diag;
}

void ensure_valid(const WorkflowDefinition& definition)
{
    auto diag = validate_workflow_definition(definition);
    if (!diag->is_valid())
    {
        throw WorkflowValidationError(diag);
    }
}

std::vector<std::string> split_command(const std::string& command)
{
    std::vector<std::string> tokens;
    std::string current;
    for (char c : command)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (!current.empty())
            {
                tokens.push_back(std::move(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(c);
        }
    }
    if (!current.empty())
    {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace stepflow
