/**
 * @file template_parser.cpp
 */
#include "jobtmpl/template/template_parser.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/template/parameter_value.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace jobtmpl
{

namespace
{

std::string index_location(const std::string& base, size_t index)
{
    return base + "[" + std::to_string(index) + "]";
}

std::string key_location(const std::string& base, const std::string& key)
{
    return base.empty() ? key : base + "." + key;
}

/**
 * @brief Walks a YAML document and builds the template object graph.
 *
 * Every read_* method reports problems into the shared Diagnostics and
 * returns what it could read, so one pass finds every structural error.
 */
class TemplateReader
{
public:
    explicit TemplateReader(Diagnostics& diagnostics)
        : m_diag(diagnostics)
    {
    }

    std::shared_ptr<JobTemplate> read_document(const YAML::Node& root)
    {
        auto tmpl = std::make_shared<JobTemplate>();
        if (!expect_map(root, ""))
        {
            return tmpl;
        }

        check_keys(root, "", {"specificationVersion", "name", "description", "parameterDefinitions",
                              "steps", "jobEnvironments", "environments"});

        auto version = read_string(root, "specificationVersion", "", true);
        if (version.has_value())
        {
            tmpl->specification_version = *version;
            if (*version != k_specification_version)
            {
                report(root["specificationVersion"], "specificationVersion",
                       "Unsupported specificationVersion '" + *version + "'; expected '" +
                           k_specification_version + "'");
            }
        }

        if (auto name = read_format_string(root, "name", "", true))
        {
            tmpl->name = std::move(*name);
        }
        tmpl->description = read_string(root, "description", "", false).value_or("");

        if (const YAML::Node params = root["parameterDefinitions"])
        {
            if (expect_sequence(params, "parameterDefinitions", true))
            {
                for (size_t i = 0; i < params.size(); ++i)
                {
                    tmpl->parameter_definitions.push_back(
                        read_parameter(params[i], index_location("parameterDefinitions", i)));
                }
            }
        }

        const YAML::Node steps = root["steps"];
        if (!steps)
        {
            report(root, "steps", "Missing required key 'steps'");
        }
        else if (expect_sequence(steps, "steps", true))
        {
            for (size_t i = 0; i < steps.size(); ++i)
            {
                tmpl->steps.push_back(read_step(steps[i], index_location("steps", i)));
            }
        }

        const bool has_job_envs = static_cast<bool>(root["jobEnvironments"]);
        const bool has_envs = static_cast<bool>(root["environments"]);
        if (has_job_envs && has_envs)
        {
            report(root["environments"], "environments",
                   "Use either 'jobEnvironments' or 'environments', not both");
        }
        const char* env_key = has_job_envs ? "jobEnvironments" : "environments";
        if (const YAML::Node envs = root[env_key])
        {
            tmpl->job_environments = read_environments(envs, env_key);
        }

        return tmpl;
    }

private:
    Diagnostics& m_diag;

    // ------------------------------------------------------------------------
    // Reporting and node checks
    // ------------------------------------------------------------------------

    void report(const YAML::Node& node, const std::string& location, const std::string& message,
                ErrorCode code = ErrorCode::Validation)
    {
        int line = -1;
        int column = -1;
        if (node.IsDefined())
        {
            const YAML::Mark mark = node.Mark();
            if (mark.line >= 0)
            {
                line = mark.line + 1;
                column = mark.column + 1;
            }
        }
        m_diag.add_error(code, location, message, line, column);
    }

    bool expect_map(const YAML::Node& node, const std::string& location)
    {
        if (!node.IsMap())
        {
            report(node, location, "Expected a mapping");
            return false;
        }
        return true;
    }

    bool expect_sequence(const YAML::Node& node, const std::string& location, bool non_empty)
    {
        if (!node.IsSequence())
        {
            report(node, location, "Expected a list");
            return false;
        }
        if (non_empty && node.size() == 0)
        {
            report(node, location, "List must not be empty");
            return false;
        }
        return true;
    }

    void check_keys(const YAML::Node& map, const std::string& location,
                    std::initializer_list<const char*> allowed)
    {
        std::set<std::string> allowed_set(allowed.begin(), allowed.end());
        for (const auto& entry : map)
        {
            if (!entry.first.IsScalar())
            {
                report(entry.first, location, "Mapping keys must be strings");
                continue;
            }
            const auto key = entry.first.as<std::string>();
            if (allowed_set.count(key) == 0)
            {
                report(entry.first, key_location(location, key), "Unknown key '" + key + "'");
            }
        }
    }

    // ------------------------------------------------------------------------
    // Scalars
    // ------------------------------------------------------------------------

    std::optional<std::string> scalar_text(const YAML::Node& node, const std::string& location)
    {
        if (!node.IsScalar())
        {
            report(node, location, "Expected a scalar value");
            return std::nullopt;
        }
        return node.Scalar();
    }

    std::optional<std::string> read_string(const YAML::Node& map, const char* key,
                                           const std::string& base, bool required)
    {
        const YAML::Node node = map[key];
        const std::string location = key_location(base, key);
        if (!node)
        {
            if (required)
            {
                report(map, location, std::string("Missing required key '") + key + "'");
            }
            return std::nullopt;
        }
        return scalar_text(node, location);
    }

    std::optional<std::string> read_nonempty_string(const YAML::Node& map, const char* key,
                                                    const std::string& base, bool required)
    {
        auto text = read_string(map, key, base, required);
        if (text.has_value() && text->empty())
        {
            report(map[key], key_location(base, key), std::string("'") + key + "' must not be empty");
            return std::nullopt;
        }
        return text;
    }

    std::optional<int64_t> read_int(const YAML::Node& map, const char* key, const std::string& base)
    {
        auto text = read_string(map, key, base, false);
        if (!text.has_value())
        {
            return std::nullopt;
        }
        auto value = parse_int64(*text);
        if (!value.has_value())
        {
            report(map[key], key_location(base, key),
                   std::string("'") + key + "' must be an integer, got '" + *text + "'");
        }
        return value;
    }

    std::optional<double> read_float(const YAML::Node& map, const char* key, const std::string& base)
    {
        auto text = read_string(map, key, base, false);
        if (!text.has_value())
        {
            return std::nullopt;
        }
        auto value = parse_float(*text);
        if (!value.has_value())
        {
            report(map[key], key_location(base, key),
                   std::string("'") + key + "' must be a number, got '" + *text + "'");
        }
        return value;
    }

    std::optional<size_t> read_length(const YAML::Node& map, const char* key, const std::string& base)
    {
        auto value = read_int(map, key, base);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        if (*value < 0)
        {
            report(map[key], key_location(base, key), std::string("'") + key + "' must not be negative");
            return std::nullopt;
        }
        return static_cast<size_t>(*value);
    }

    std::optional<bool> read_bool(const YAML::Node& map, const char* key, const std::string& base)
    {
        auto text = read_string(map, key, base, false);
        if (!text.has_value())
        {
            return std::nullopt;
        }
        if (*text == "true" || *text == "True" || *text == "TRUE")
        {
            return true;
        }
        if (*text == "false" || *text == "False" || *text == "FALSE")
        {
            return false;
        }
        report(map[key], key_location(base, key),
               std::string("'") + key + "' must be true or false, got '" + *text + "'");
        return std::nullopt;
    }

    std::optional<FormatString> parse_format(const YAML::Node& node, const std::string& location)
    {
        auto text = scalar_text(node, location);
        if (!text.has_value())
        {
            return std::nullopt;
        }
        try
        {
            return FormatString::parse(*text);
        }
        catch (const FormatStringError& e)
        {
            report(node, location, e.what(), ErrorCode::FormatString);
            return std::nullopt;
        }
    }

    std::optional<FormatString> read_format_string(const YAML::Node& map, const char* key,
                                                   const std::string& base, bool required)
    {
        const YAML::Node node = map[key];
        const std::string location = key_location(base, key);
        if (!node)
        {
            if (required)
            {
                report(map, location, std::string("Missing required key '") + key + "'");
            }
            return std::nullopt;
        }
        return parse_format(node, location);
    }

    // ------------------------------------------------------------------------
    // Parameters
    // ------------------------------------------------------------------------

    void reject_key_for_type(const YAML::Node& map, const char* key, const std::string& base,
                             ParameterType type)
    {
        if (map[key])
        {
            report(map[key], key_location(base, key),
                   std::string("'") + key + "' is not valid for " + to_string(type) + " parameters");
        }
    }

    JobParameterDefinition read_parameter(const YAML::Node& node, const std::string& location)
    {
        JobParameterDefinition def;
        def.location = location;
        if (!expect_map(node, location))
        {
            return def;
        }

        check_keys(node, location, {"name", "type", "description", "default", "allowedValues",
                                    "minValue", "maxValue", "minLength", "maxLength", "dataFlow",
                                    "objectType", "userInterface"});

        def.name = read_nonempty_string(node, "name", location, true).value_or("");
        def.description = read_string(node, "description", location, false).value_or("");

        if (auto type_text = read_string(node, "type", location, true))
        {
            auto type = parse_parameter_type(*type_text);
            if (!type.has_value())
            {
                report(node["type"], key_location(location, "type"),
                       "Unknown parameter type '" + *type_text +
                           "'; expected STRING, PATH, INT or FLOAT");
            }
            else
            {
                def.type = *type;
            }
        }
        def.constraints = make_constraints(def.type);

        switch (def.type)
        {
        case ParameterType::String:
        {
            auto& c = std::get<StringConstraints>(def.constraints);
            c.min_length = read_length(node, "minLength", location);
            c.max_length = read_length(node, "maxLength", location);
            reject_key_for_type(node, "minValue", location, def.type);
            reject_key_for_type(node, "maxValue", location, def.type);
            reject_key_for_type(node, "dataFlow", location, def.type);
            reject_key_for_type(node, "objectType", location, def.type);
            break;
        }
        case ParameterType::Path:
        {
            auto& c = std::get<PathConstraints>(def.constraints);
            c.min_length = read_length(node, "minLength", location);
            c.max_length = read_length(node, "maxLength", location);
            if (auto flow_text = read_string(node, "dataFlow", location, false))
            {
                c.data_flow = parse_data_flow(*flow_text);
                if (!c.data_flow.has_value())
                {
                    report(node["dataFlow"], key_location(location, "dataFlow"),
                           "Unknown dataFlow '" + *flow_text + "'; expected NONE, IN, OUT or INOUT");
                }
            }
            if (auto object_text = read_string(node, "objectType", location, false))
            {
                c.object_type = parse_object_type(*object_text);
                if (!c.object_type.has_value())
                {
                    report(node["objectType"], key_location(location, "objectType"),
                           "Unknown objectType '" + *object_text + "'; expected FILE or DIRECTORY");
                }
            }
            reject_key_for_type(node, "minValue", location, def.type);
            reject_key_for_type(node, "maxValue", location, def.type);
            break;
        }
        case ParameterType::Int:
        {
            auto& c = std::get<IntConstraints>(def.constraints);
            c.min_value = read_int(node, "minValue", location);
            c.max_value = read_int(node, "maxValue", location);
            reject_key_for_type(node, "minLength", location, def.type);
            reject_key_for_type(node, "maxLength", location, def.type);
            reject_key_for_type(node, "dataFlow", location, def.type);
            reject_key_for_type(node, "objectType", location, def.type);
            break;
        }
        case ParameterType::Float:
        {
            auto& c = std::get<FloatConstraints>(def.constraints);
            c.min_value = read_float(node, "minValue", location);
            c.max_value = read_float(node, "maxValue", location);
            reject_key_for_type(node, "minLength", location, def.type);
            reject_key_for_type(node, "maxLength", location, def.type);
            reject_key_for_type(node, "dataFlow", location, def.type);
            reject_key_for_type(node, "objectType", location, def.type);
            break;
        }
        }

        def.default_value = read_string(node, "default", location, false);

        if (const YAML::Node allowed = node["allowedValues"])
        {
            const std::string allowed_location = key_location(location, "allowedValues");
            if (expect_sequence(allowed, allowed_location, true))
            {
                for (size_t i = 0; i < allowed.size(); ++i)
                {
                    if (auto text = scalar_text(allowed[i], index_location(allowed_location, i)))
                    {
                        def.allowed_values.push_back(*text);
                    }
                }
            }
        }

        if (const YAML::Node ui = node["userInterface"])
        {
            if (!ui.IsMap())
            {
                m_diag.add_warning(key_location(location, "userInterface"),
                                   "'userInterface' should be a mapping; it is ignored");
            }
        }

        return def;
    }

    // ------------------------------------------------------------------------
    // Actions and scripts
    // ------------------------------------------------------------------------

    Action read_action(const YAML::Node& node, const std::string& location)
    {
        Action action;
        action.location = location;
        if (!expect_map(node, location))
        {
            return action;
        }

        check_keys(node, location, {"command", "args", "timeout", "cancelation"});

        if (auto command = read_format_string(node, "command", location, true))
        {
            action.command = std::move(*command);
            if (action.command.text().empty())
            {
                report(node["command"], key_location(location, "command"),
                       "'command' must not be empty");
            }
        }

        if (const YAML::Node args = node["args"])
        {
            const std::string args_location = key_location(location, "args");
            if (expect_sequence(args, args_location, false))
            {
                for (size_t i = 0; i < args.size(); ++i)
                {
                    if (auto arg = parse_format(args[i], index_location(args_location, i)))
                    {
                        action.args.push_back(std::move(*arg));
                    }
                }
            }
        }

        if (auto timeout = read_int(node, "timeout", location))
        {
            if (*timeout <= 0 || *timeout > k_max_action_timeout.count())
            {
                report(node["timeout"], key_location(location, "timeout"),
                       "'timeout' must be between 1 and " +
                           std::to_string(k_max_action_timeout.count()) + " seconds, got " +
                           std::to_string(*timeout));
            }
            else
            {
                action.timeout = std::chrono::seconds(*timeout);
            }
        }

        if (const YAML::Node cancel = node["cancelation"])
        {
            action.cancelation = read_cancelation(cancel, key_location(location, "cancelation"));
        }

        return action;
    }

    CancelationMethod read_cancelation(const YAML::Node& node, const std::string& location)
    {
        CancelationMethod method;
        if (!expect_map(node, location))
        {
            return method;
        }
        check_keys(node, location, {"mode", "notifyPeriodInSeconds"});

        if (auto mode = read_string(node, "mode", location, true))
        {
            if (*mode == "TERMINATE")
            {
                method.mode = CancelationMode::Terminate;
            }
            else if (*mode == "NOTIFY_THEN_TERMINATE")
            {
                method.mode = CancelationMode::NotifyThenTerminate;
            }
            else
            {
                report(node["mode"], key_location(location, "mode"),
                       "Unknown cancelation mode '" + *mode +
                           "'; expected TERMINATE or NOTIFY_THEN_TERMINATE");
            }
        }

        if (auto period = read_int(node, "notifyPeriodInSeconds", location))
        {
            const std::string period_location = key_location(location, "notifyPeriodInSeconds");
            if (method.mode != CancelationMode::NotifyThenTerminate)
            {
                report(node["notifyPeriodInSeconds"], period_location,
                       "'notifyPeriodInSeconds' requires mode NOTIFY_THEN_TERMINATE");
            }
            else if (*period <= 0 || *period > k_max_notify_period.count())
            {
                report(node["notifyPeriodInSeconds"], period_location,
                       "'notifyPeriodInSeconds' must be between 1 and " +
                           std::to_string(k_max_notify_period.count()));
            }
            else
            {
                method.notify_period = std::chrono::seconds(*period);
            }
        }

        return method;
    }

    std::vector<EmbeddedFile> read_embedded_files(const YAML::Node& node, const std::string& location)
    {
        std::vector<EmbeddedFile> files;
        if (!expect_sequence(node, location, true))
        {
            return files;
        }

        for (size_t i = 0; i < node.size(); ++i)
        {
            const YAML::Node item = node[i];
            const std::string item_location = index_location(location, i);
            EmbeddedFile file;
            file.location = item_location;
            if (!expect_map(item, item_location))
            {
                continue;
            }
            check_keys(item, item_location, {"name", "type", "filename", "runnable", "data"});

            file.name = read_nonempty_string(item, "name", item_location, true).value_or("");
            if (auto type = read_string(item, "type", item_location, true))
            {
                if (*type != "TEXT")
                {
                    report(item["type"], key_location(item_location, "type"),
                           "Unknown embedded file type '" + *type + "'; expected TEXT");
                }
            }
            if (auto filename = read_nonempty_string(item, "filename", item_location, false))
            {
                if (filename->find_first_of("/\\") != std::string::npos || *filename == "." ||
                    *filename == "..")
                {
                    report(item["filename"], key_location(item_location, "filename"),
                           "'filename' must be a bare file name, got '" + *filename + "'");
                }
                else
                {
                    file.filename = *filename;
                }
            }
            file.runnable = read_bool(item, "runnable", item_location).value_or(false);
            if (auto data = read_format_string(item, "data", item_location, true))
            {
                file.data = std::move(*data);
            }
            files.push_back(std::move(file));
        }
        return files;
    }

    StepScript read_step_script(const YAML::Node& node, const std::string& location)
    {
        StepScript script;
        script.location = location;
        if (!expect_map(node, location))
        {
            return script;
        }
        check_keys(node, location, {"actions", "embeddedFiles"});

        const std::string actions_location = key_location(location, "actions");
        const YAML::Node actions = node["actions"];
        if (!actions)
        {
            report(node, actions_location, "Missing required key 'actions'");
        }
        else if (expect_map(actions, actions_location))
        {
            check_keys(actions, actions_location, {"onRun"});
            if (const YAML::Node on_run = actions["onRun"])
            {
                script.on_run = read_action(on_run, key_location(actions_location, "onRun"));
            }
            else
            {
                report(actions, key_location(actions_location, "onRun"),
                       "Missing required key 'onRun'");
            }
        }

        if (const YAML::Node files = node["embeddedFiles"])
        {
            script.embedded_files = read_embedded_files(files, key_location(location, "embeddedFiles"));
        }
        return script;
    }

    EnvironmentScript read_environment_script(const YAML::Node& node, const std::string& location)
    {
        EnvironmentScript script;
        script.location = location;
        if (!expect_map(node, location))
        {
            return script;
        }
        check_keys(node, location, {"actions", "embeddedFiles"});

        const std::string actions_location = key_location(location, "actions");
        const YAML::Node actions = node["actions"];
        if (!actions)
        {
            report(node, actions_location, "Missing required key 'actions'");
        }
        else if (expect_map(actions, actions_location))
        {
            check_keys(actions, actions_location, {"onEnter", "onExit"});
            if (const YAML::Node on_enter = actions["onEnter"])
            {
                script.on_enter = read_action(on_enter, key_location(actions_location, "onEnter"));
            }
            if (const YAML::Node on_exit = actions["onExit"])
            {
                script.on_exit = read_action(on_exit, key_location(actions_location, "onExit"));
            }
            if (!script.on_enter.has_value() && !script.on_exit.has_value())
            {
                report(actions, actions_location,
                       "Environment actions require at least one of 'onEnter' or 'onExit'");
            }
        }

        if (const YAML::Node files = node["embeddedFiles"])
        {
            script.embedded_files = read_embedded_files(files, key_location(location, "embeddedFiles"));
        }
        return script;
    }

    // ------------------------------------------------------------------------
    // Environments
    // ------------------------------------------------------------------------

    std::vector<Environment> read_environments(const YAML::Node& node, const std::string& location)
    {
        std::vector<Environment> envs;
        if (!expect_sequence(node, location, true))
        {
            return envs;
        }
        for (size_t i = 0; i < node.size(); ++i)
        {
            envs.push_back(read_environment(node[i], index_location(location, i)));
        }
        return envs;
    }

    Environment read_environment(const YAML::Node& node, const std::string& location)
    {
        Environment env;
        env.location = location;
        if (!expect_map(node, location))
        {
            return env;
        }
        check_keys(node, location, {"name", "description", "script", "variables"});

        env.name = read_nonempty_string(node, "name", location, true).value_or("");
        env.description = read_string(node, "description", location, false).value_or("");

        if (const YAML::Node script = node["script"])
        {
            env.script = read_environment_script(script, key_location(location, "script"));
        }

        if (const YAML::Node variables = node["variables"])
        {
            const std::string vars_location = key_location(location, "variables");
            if (expect_map(variables, vars_location))
            {
                if (variables.size() == 0)
                {
                    report(variables, vars_location, "'variables' must not be empty");
                }
                for (const auto& entry : variables)
                {
                    if (!entry.first.IsScalar())
                    {
                        report(entry.first, vars_location, "Variable names must be strings");
                        continue;
                    }
                    const auto var_name = entry.first.as<std::string>();
                    if (auto value = parse_format(entry.second, key_location(vars_location, var_name)))
                    {
                        env.variables.push_back(EnvironmentVariable{var_name, std::move(*value)});
                    }
                }
            }
        }

        if (!node["script"] && !node["variables"])
        {
            report(node, location, "Environment '" + env.name +
                                       "' requires at least one of 'script' or 'variables'");
        }
        return env;
    }

    // ------------------------------------------------------------------------
    // Steps
    // ------------------------------------------------------------------------

    TaskParameterDefinition read_task_parameter(const YAML::Node& node, const std::string& location)
    {
        TaskParameterDefinition def;
        def.location = location;
        if (!expect_map(node, location))
        {
            return def;
        }
        check_keys(node, location, {"name", "type", "range"});

        def.name = read_nonempty_string(node, "name", location, true).value_or("");
        if (auto type_text = read_string(node, "type", location, true))
        {
            auto type = parse_parameter_type(*type_text);
            if (!type.has_value())
            {
                report(node["type"], key_location(location, "type"),
                       "Unknown task parameter type '" + *type_text +
                           "'; expected INT, FLOAT, STRING or PATH");
            }
            else
            {
                def.type = *type;
            }
        }

        const std::string range_location = key_location(location, "range");
        const YAML::Node range = node["range"];
        if (!range)
        {
            report(node, range_location, "Missing required key 'range'");
        }
        else if (range.IsSequence())
        {
            if (range.size() == 0)
            {
                report(range, range_location, "'range' must not be empty");
            }
            for (size_t i = 0; i < range.size(); ++i)
            {
                if (auto value = parse_format(range[i], index_location(range_location, i)))
                {
                    def.range_values.push_back(std::move(*value));
                }
            }
        }
        else if (range.IsScalar())
        {
            if (def.type != ParameterType::Int)
            {
                report(range, range_location,
                       std::string("'range' for ") + to_string(def.type) +
                           " task parameters must be a list");
            }
            else
            {
                def.range_expression = parse_format(range, range_location);
            }
        }
        else
        {
            report(range, range_location, "'range' must be a list or a range expression string");
        }

        return def;
    }

    StepParameterSpace read_parameter_space(const YAML::Node& node, const std::string& location)
    {
        StepParameterSpace space;
        space.location = location;
        if (!expect_map(node, location))
        {
            return space;
        }
        check_keys(node, location, {"taskParameterDefinitions", "combination"});

        const std::string defs_location = key_location(location, "taskParameterDefinitions");
        const YAML::Node defs = node["taskParameterDefinitions"];
        if (!defs)
        {
            report(node, defs_location, "Missing required key 'taskParameterDefinitions'");
        }
        else if (expect_sequence(defs, defs_location, true))
        {
            for (size_t i = 0; i < defs.size(); ++i)
            {
                space.task_parameter_definitions.push_back(
                    read_task_parameter(defs[i], index_location(defs_location, i)));
            }
        }

        space.combination = read_nonempty_string(node, "combination", location, false);
        return space;
    }

    Step read_step(const YAML::Node& node, const std::string& location)
    {
        Step step;
        step.location = location;
        if (!expect_map(node, location))
        {
            return step;
        }
        check_keys(node, location, {"name", "description", "dependencies", "parameterSpace",
                                    "script", "stepEnvironments"});

        step.name = read_nonempty_string(node, "name", location, true).value_or("");
        step.description = read_string(node, "description", location, false).value_or("");

        if (const YAML::Node deps = node["dependencies"])
        {
            const std::string deps_location = key_location(location, "dependencies");
            if (expect_sequence(deps, deps_location, true))
            {
                for (size_t i = 0; i < deps.size(); ++i)
                {
                    const std::string dep_location = index_location(deps_location, i);
                    if (!expect_map(deps[i], dep_location))
                    {
                        continue;
                    }
                    check_keys(deps[i], dep_location, {"dependsOn"});
                    if (auto target = read_nonempty_string(deps[i], "dependsOn", dep_location, true))
                    {
                        StepDependency dep;
                        dep.depends_on = *target;
                        dep.location = key_location(dep_location, "dependsOn");
                        step.dependencies.push_back(std::move(dep));
                    }
                }
            }
        }

        if (const YAML::Node space = node["parameterSpace"])
        {
            step.parameter_space = read_parameter_space(space, key_location(location, "parameterSpace"));
        }

        const YAML::Node script = node["script"];
        if (!script)
        {
            report(node, key_location(location, "script"), "Missing required key 'script'");
        }
        else
        {
            step.script = read_step_script(script, key_location(location, "script"));
        }

        if (const YAML::Node envs = node["stepEnvironments"])
        {
            step.step_environments = read_environments(envs, key_location(location, "stepEnvironments"));
        }
        return step;
    }
};

} // namespace

ParseResult parse_job_template(const std::string& document)
{
    ParseResult result;

    YAML::Node root;
    try
    {
        root = YAML::Load(document);
    }
    catch (const YAML::ParserException& e)
    {
        const int line = e.mark.line >= 0 ? e.mark.line + 1 : -1;
        const int column = e.mark.column >= 0 ? e.mark.column + 1 : -1;
        result.diagnostics.add_error(ErrorCode::Validation, "",
                                     "Document is not valid YAML/JSON: " + e.msg, line, column);
        return result;
    }

    TemplateReader reader(result.diagnostics);
    auto tmpl = reader.read_document(root);

    if (result.diagnostics.has_errors())
    {
        JOBTMPL_LOG_DEBUG("Template parsing found " + std::to_string(result.diagnostics.errors().size()) +
                          " structural error(s)");
        return result;
    }

    result.job_template = std::move(tmpl);
    return result;
}

ParseResult load_job_template(const std::filesystem::path& file)
{
    std::ifstream in(file);
    if (!in)
    {
        ParseResult result;
        result.diagnostics.add_error(ErrorCode::Validation, "",
                                     "Cannot read template file: " + file.string());
        return result;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parse_job_template(content.str());
}

} // namespace jobtmpl
