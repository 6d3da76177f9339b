/**
 * @file workflow_loader.cpp
 */
#include "stepflow/common/workflow_loader.hpp"
#include "stepflow/common/stepflow_exceptions.hpp"

#include <fstream>
#include <istream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace stepflow
{

namespace
{

std::string location_of(const YAML::Node& node)
{
    const YAML::Mark mark = node.Mark();
    if (mark.is_null())
    {
        return "";
    }
    return " (line " + std::to_string(mark.line + 1) + ", column " +
        std::to_string(mark.column + 1) + ")";
}

std::string scalar_field(const YAML::Node& parent, const char* key, const std::string& context)
{
    const YAML::Node node = parent[key];
    if (!node)
    {
        throw WorkflowLoadError(context + ": missing '" + key + "'" + location_of(parent));
    }
    if (!node.IsScalar())
    {
        throw WorkflowLoadError(context + ": '" + key + "' must be a scalar" + location_of(node));
    }
    return node.Scalar();
}

std::vector<std::string> parse_depends_on(const YAML::Node& step_node, const std::string& context)
{
    std::vector<std::string> result;
    const YAML::Node deps = step_node["depends_on"];
    if (!deps || deps.IsNull())
    {
        return result;
    }
    if (!deps.IsSequence())
    {
        throw WorkflowLoadError(context + ": 'depends_on' must be a sequence" + location_of(deps));
    }
    for (const auto& dep : deps)
    {
        if (!dep.IsScalar())
        {
            throw WorkflowLoadError(context + ": 'depends_on' entries must be scalars" +
                                    location_of(dep));
        }
        result.push_back(dep.Scalar());
    }
    return result;
}

std::map<std::string, std::string> parse_metadata(const YAML::Node& root)
{
    std::map<std::string, std::string> result;
    const YAML::Node metadata = root["metadata"];
    if (!metadata || metadata.IsNull())
    {
        return result;
    }
    if (!metadata.IsMap())
    {
        throw WorkflowLoadError("'metadata' must be a map" + location_of(metadata));
    }
    for (const auto& entry : metadata)
    {
        if (!entry.first.IsScalar() || !entry.second.IsScalar())
        {
            throw WorkflowLoadError("'metadata' keys and values must be scalars" +
                                    location_of(entry.first));
        }
        result[entry.first.Scalar()] = entry.second.Scalar();
    }
    return result;
}

WorkflowDefinition from_root(const YAML::Node& root)
{
    if (!root.IsMap())
    {
        throw WorkflowLoadError("Workflow document must be a map" + location_of(root));
    }

    WorkflowDefinition definition;
    definition.version = scalar_field(root, "version", "Workflow document");
    definition.metadata = parse_metadata(root);

    const YAML::Node steps = root["steps"];
    if (!steps || steps.IsNull())
    {
        return definition;
    }
    if (!steps.IsSequence())
    {
        throw WorkflowLoadError("'steps' must be a sequence" + location_of(steps));
    }

    size_t index = 0;
    for (const auto& step_node : steps)
    {
        const std::string context = "Step #" + std::to_string(index);
        if (!step_node.IsMap())
        {
            throw WorkflowLoadError(context + " must be a map" + location_of(step_node));
        }

        StepDefinition step;
        step.name = scalar_field(step_node, "name", context);
        step.command = scalar_field(step_node, "command", context + " '" + step.name + "'");
        step.depends_on = parse_depends_on(step_node, context + " '" + step.name + "'");
        definition.steps.push_back(std::move(step));
        ++index;
    }

    return definition;
}

} // namespace

WorkflowDefinition load_workflow_definition(std::istream& input)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(input);
    }
    catch (const YAML::Exception& e)
    {
        throw WorkflowLoadError(std::string("Malformed workflow document: ") + e.what());
    }
    return from_root(root);
}

WorkflowDefinition load_workflow_definition_from_string(const std::string& text)
{
    std::istringstream input(text);
    return load_workflow_definition(input);
}

WorkflowDefinition load_workflow_definition_from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw WorkflowLoadError("Cannot open workflow file '" + path + "'");
    }
    return load_workflow_definition(file);
}

} // namespace stepflow
