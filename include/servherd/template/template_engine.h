#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <servherd/config/global_config.h>
#include <servherd/core/types.h>
#include <servherd/registry/server_entry.h>

namespace servherd::templates {

/// Variable name -> rendered value
using TemplateVariables = std::map<std::string, std::string>;

/// Thrown by the `$` lookup form when the lookup cannot be satisfied
class TemplateLookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Context for `{{$ "server" "property" ["cwd"]}}` lookups.
 * `lookupServer(name, cwd)` resolves a sibling server registered under `cwd`.
 */
struct TemplateContext {
    std::function<std::optional<registry::ServerEntry>(const std::string& name,
                                                       const std::string& cwd)>
        lookupServer;
    std::optional<std::string> cwd;
};

/**
 * @brief Renders `{{name}}` placeholders.
 *
 * Known variables are substituted; unknown ones are left verbatim so missing values can be
 * reported later. The `$` form resolves a sibling server property through `context` and
 * throws TemplateLookupError when the server, the property, the lookup function or the
 * scoping directory is missing.
 */
std::string render(std::string_view tmpl, const TemplateVariables& vars,
                   const TemplateContext& context = {});

/// Renders every value of an environment map
EnvMap renderEnvTemplates(const EnvMap& env, const TemplateVariables& vars,
                          const TemplateContext& context = {});

/// Distinct placeholder names in order of first use, excluding the `$` form
std::vector<std::string> extractVariableNames(std::string_view tmpl);

/// Built-in template variable -> configuration key (nullopt for auto-derived port/url)
const std::map<std::string, std::optional<std::string>>& builtinConfigKeys();

bool isBuiltinVariable(const std::string& name);

struct MissingVariable {
    std::string templateVar;
    std::optional<std::string> configKey;
    bool configurable{false};
    bool isCustom{false};
};

/// Referenced variables whose value is absent or empty
std::vector<MissingVariable> findMissingVariables(std::string_view tmpl,
                                                  const TemplateVariables& vars);

/// Multi-line explanation with the config command that fixes each missing variable
std::string formatMissingVariablesError(const std::vector<MissingVariable>& missing);

/**
 * Variables available to a server: custom variables first, then the built-ins
 * port, hostname, url, https-cert and https-key (built-ins win on a name clash).
 */
TemplateVariables getTemplateVariables(const config::GlobalConfig& config, int port,
                                       std::optional<Protocol> protocol = std::nullopt,
                                       std::optional<std::string> hostname = std::nullopt);

/// Parses KEY=VALUE strings, splitting on the first '='
Result<EnvMap> parseEnvStrings(const std::vector<std::string>& entries);

} // namespace servherd::templates
