#pragma once

#include "qapp/types.hpp"

#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Template Rendering
// ============================================================================

/**
 * Renders the text of one source file against a variable scope.
 *
 * Implementations must fail with TEMPLATE_ERROR on undefined variables and
 * on syntax errors; they never touch the filesystem.
 */
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;

    virtual Result<std::string> render(const std::string& text,
                                       const VariableMap& variables,
                                       const std::string& source_path) const = 0;
};

/**
 * Default renderer: substitutes {{ name }} placeholders.
 *
 * Names are [A-Za-z_][A-Za-z0-9_]*, surrounding whitespace inside the braces
 * is ignored. Everything outside a placeholder is copied unchanged.
 */
class PlaceholderRenderer : public TemplateRenderer {
public:
    Result<std::string> render(const std::string& text,
                               const VariableMap& variables,
                               const std::string& source_path) const override;
};

// ============================================================================
// Variable Sources
// ============================================================================

// Parse "key=value" assignments (value may contain '='). CONFIG_ERROR on
// entries without '=' or with an empty key.
Result<VariableMap> parse_variable_assignments(const std::vector<std::string>& assignments);

// Load a JSON object of string / number / boolean values. CONFIG_ERROR on
// unreadable files, malformed JSON or nested values.
Result<VariableMap> load_variables_file(const std::string& path);

// Overlay `overrides` onto `base`; later sources win
VariableMap merge_variables(const VariableMap& base, const VariableMap& overrides);

} // namespace qapp
