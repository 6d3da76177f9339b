/**
 * @file workflow_loader.hpp
 * @brief YAML deserialization of workflow documents.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/workflow_definition.hpp"
#include <iosfwd>

namespace stepflow
{

/**
 * @brief Parse a workflow document from a YAML stream.
 *
 * @details
 * Only the document's shape is checked here: the top level must be a map,
 * `steps` a sequence of maps with scalar `name` and `command`, `metadata` a map
 * of scalars and `depends_on` a sequence of scalars. Missing `metadata` and
 * `depends_on` default to empty. Semantic checks (version, names, references)
 * are left to `validate_workflow_definition()`.
 *
 * @throws WorkflowLoadError on YAML syntax errors or shape errors.
 */
WorkflowDefinition load_workflow_definition(std::istream& input);

/**
 * @brief Parse a workflow document held in a string.
 * @throws WorkflowLoadError on YAML syntax errors or shape errors.
 */
WorkflowDefinition load_workflow_definition_from_string(const std::string& text);

/**
 * @brief Parse a workflow document from a file.
 * @throws WorkflowLoadError if the file cannot be opened or parsed.
 */
WorkflowDefinition load_workflow_definition_from_file(const std::string& path);

} // namespace stepflow
