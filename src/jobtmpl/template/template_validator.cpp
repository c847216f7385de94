/**
 * @file template_validator.cpp
 */
#include "jobtmpl/template/template_validator.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/common/step_graph.hpp"
#include "jobtmpl/expansion/range_expr.hpp"
#include "jobtmpl/format/symbol_table.hpp"
#include "jobtmpl/template/parameter_constraints.hpp"
#include "jobtmpl/template/parameter_value.hpp"
#include "jobtmpl/template/template_parser.hpp"

#include <set>

namespace jobtmpl
{

namespace
{

constexpr size_t k_max_entity_name_length = 64;

/**
 * @brief Reports names that repeat within one namespace.
 */
class UniqueNames
{
public:
    UniqueNames(Diagnostics& diagnostics, std::string kind)
        : m_diag(diagnostics)
        , m_kind(std::move(kind))
    {
    }

    void add(const std::string& name, const std::string& location)
    {
        if (name.empty())
        {
            return;
        }
        if (!m_seen.insert(name).second)
        {
            m_diag.add_error(ErrorCode::Validation, location,
                             "Duplicate " + m_kind + " name '" + name + "'");
        }
    }

private:
    Diagnostics& m_diag;
    std::string m_kind;
    std::set<std::string> m_seen;
};

void check_identifier(const std::string& name, const std::string& kind, const std::string& location,
                      Diagnostics& diagnostics)
{
    if (!name.empty() && !is_identifier(name))
    {
        diagnostics.add_error(ErrorCode::Validation, location,
                              kind + " name '" + name +
                                  "' must start with a letter or underscore and contain only "
                                  "letters, digits and underscores");
    }
}

void check_entity_name(const std::string& name, const std::string& kind, const std::string& location,
                       Diagnostics& diagnostics)
{
    if (name.size() > k_max_entity_name_length)
    {
        diagnostics.add_error(ErrorCode::Validation, location,
                              kind + " name '" + name + "' is longer than " +
                                  std::to_string(k_max_entity_name_length) + " characters");
    }
}

void bind_field(FormatString& format, const SymbolTable& symbols, const std::string& location,
                Diagnostics& diagnostics)
{
    for (auto& problem : bind_references(format, symbols))
    {
        diagnostics.add_error(ErrorCode::UnresolvedReference, location, std::move(problem));
    }
}

/**
 * @brief Walks a template and binds every format string.
 */
class TemplateChecker
{
public:
    TemplateChecker(JobTemplate& tmpl, Diagnostics& diagnostics)
        : m_tmpl(tmpl)
        , m_diag(diagnostics)
        , m_parameter_names(tmpl.parameter_names())
    {
    }

    void run()
    {
        check_parameters();
        check_environment_names();
        check_steps();
        check_dependencies();
        bind_job_fields();
        for (auto& env : m_tmpl.job_environments)
        {
            bind_environment(env);
        }
        for (auto& step : m_tmpl.steps)
        {
            check_parameter_space(step);
            bind_step(step);
        }
    }

private:
    JobTemplate& m_tmpl;
    Diagnostics& m_diag;
    std::vector<std::string> m_parameter_names;

    // ------------------------------------------------------------------------
    // Names and constraints
    // ------------------------------------------------------------------------

    void check_parameters()
    {
        UniqueNames names(m_diag, "parameter");
        for (const auto& def : m_tmpl.parameter_definitions)
        {
            check_identifier(def.name, "Parameter", def.location, m_diag);
            names.add(def.name, def.location);
            check_constraint_consistency(def, m_diag);
        }
    }

    void check_environment(const Environment& env)
    {
        check_entity_name(env.name, "Environment", env.location, m_diag);
        UniqueNames vars(m_diag, "variable");
        for (const auto& var : env.variables)
        {
            check_identifier(var.name, "Variable", env.location + ".variables." + var.name, m_diag);
            vars.add(var.name, env.location + ".variables." + var.name);
        }
        if (env.script.has_value())
        {
            check_embedded_file_names(env.script->embedded_files);
        }
    }

    void check_environment_names()
    {
        UniqueNames names(m_diag, "environment");
        for (const auto& env : m_tmpl.job_environments)
        {
            names.add(env.name, env.location);
            check_environment(env);
        }
        for (const auto& step : m_tmpl.steps)
        {
            // Step environments share the namespace of the job environments
            UniqueNames step_names = names;
            for (const auto& env : step.step_environments)
            {
                step_names.add(env.name, env.location);
                check_environment(env);
            }
        }
    }

    void check_embedded_file_names(const std::vector<EmbeddedFile>& files)
    {
        UniqueNames names(m_diag, "embedded file");
        UniqueNames filenames(m_diag, "embedded file filename");
        for (const auto& file : files)
        {
            check_identifier(file.name, "Embedded file", file.location, m_diag);
            names.add(file.name, file.location);
            if (file.filename.has_value())
            {
                filenames.add(*file.filename, file.location);
            }
        }
    }

    void check_steps()
    {
        UniqueNames names(m_diag, "step");
        for (const auto& step : m_tmpl.steps)
        {
            check_entity_name(step.name, "Step", step.location, m_diag);
            names.add(step.name, step.location);
            check_embedded_file_names(step.script.embedded_files);
            if (step.parameter_space.has_value())
            {
                UniqueNames task_names(m_diag, "task parameter");
                for (const auto& def : step.parameter_space->task_parameter_definitions)
                {
                    check_identifier(def.name, "Task parameter", def.location, m_diag);
                    task_names.add(def.name, def.location);
                }
            }
        }
    }

    // ------------------------------------------------------------------------
    // Dependencies
    // ------------------------------------------------------------------------

    void check_dependencies()
    {
        StepGraph graph(false);
        for (StepIdx i = 0; i < m_tmpl.steps.size(); ++i)
        {
            graph.add_step(i);
        }

        for (StepIdx i = 0; i < m_tmpl.steps.size(); ++i)
        {
            auto& step = m_tmpl.steps[i];
            std::set<StepIdx> seen;
            for (auto& dep : step.dependencies)
            {
                auto target = m_tmpl.find_step(dep.depends_on);
                if (!target.has_value())
                {
                    m_diag.add_error(ErrorCode::Validation, dep.location,
                                     "Step '" + step.name + "' depends on unknown step '" +
                                         dep.depends_on + "'");
                    continue;
                }
                if (*target == i)
                {
                    m_diag.add_error(ErrorCode::CyclicDependency, dep.location,
                                     "Step '" + step.name + "' depends on itself");
                    continue;
                }
                if (!seen.insert(*target).second)
                {
                    m_diag.add_error(ErrorCode::Validation, dep.location,
                                     "Step '" + step.name + "' lists dependency '" + dep.depends_on +
                                         "' more than once");
                    continue;
                }
                dep.handle = *target;
                graph.link_steps(*target, i);
            }
        }

        if (auto cycle = graph.find_cycle())
        {
            std::string path;
            for (size_t k = 0; k < cycle->size(); ++k)
            {
                if (k > 0)
                {
                    path += " -> ";
                }
                path += m_tmpl.steps[(*cycle)[k]].name;
            }
            m_diag.add_error(ErrorCode::CyclicDependency, m_tmpl.steps[cycle->front()].location,
                             "Cyclic step dependency: " + path);
        }
    }

    // ------------------------------------------------------------------------
    // Parameter spaces
    // ------------------------------------------------------------------------

    /**
     * @brief Number of values the range of `def` produces, if it is literal
     *        and valid.
     */
    std::optional<size_t> check_range(const TaskParameterDefinition& def)
    {
        if (def.range_expression.has_value())
        {
            if (!def.range_expression->is_literal())
            {
                return std::nullopt;
            }
            try
            {
                return IntRangeExpr::parse(def.range_expression->text()).size();
            }
            catch (const RangeExpansionError& e)
            {
                m_diag.add_error(ErrorCode::RangeExpansion, def.location + ".range",
                                 "Task parameter '" + def.name + "': " + e.what());
                return std::nullopt;
            }
        }

        bool all_literal = true;
        for (size_t i = 0; i < def.range_values.size(); ++i)
        {
            const auto& value = def.range_values[i];
            if (!value.is_literal())
            {
                all_literal = false;
                continue;
            }
            if (!ParameterValue::make(def.type, value.text()).has_value())
            {
                m_diag.add_error(ErrorCode::Validation,
                                 def.location + ".range[" + std::to_string(i) + "]",
                                 "Task parameter '" + def.name + "': '" + value.text() +
                                     "' is not a valid " + to_string(def.type) + " value");
            }
        }
        if (!all_literal)
        {
            return std::nullopt;
        }
        return def.range_values.size();
    }

    void check_parameter_space(Step& step)
    {
        if (!step.parameter_space.has_value())
        {
            return;
        }
        auto& space = *step.parameter_space;

        SymbolTable job_scope;
        job_scope.allow(SymbolScope::Param, m_parameter_names);
        job_scope.allow(SymbolScope::RawParam, m_parameter_names);
        job_scope.set_description("task parameter ranges may reference Param and RawParam only");

        std::vector<std::optional<size_t>> counts;
        for (auto& def : space.task_parameter_definitions)
        {
            if (def.range_expression.has_value())
            {
                bind_field(*def.range_expression, job_scope, def.location + ".range", m_diag);
            }
            for (size_t i = 0; i < def.range_values.size(); ++i)
            {
                bind_field(def.range_values[i], job_scope,
                           def.location + ".range[" + std::to_string(i) + "]", m_diag);
            }
            counts.push_back(check_range(def));
        }

        const std::string location = space.location + ".combination";
        CombinationNode tree;
        try
        {
            tree = space.combination.has_value() ? parse_combination_expression(*space.combination)
                                                 : default_combination(space.parameter_names());
        }
        catch (const ValidationError& e)
        {
            m_diag.add_error(ErrorCode::Validation, location, e.what());
            return;
        }

        const auto problems = bind_combination(tree, space.parameter_names());
        for (const auto& problem : problems)
        {
            m_diag.add_error(ErrorCode::Validation, location, problem);
        }
        if (!problems.empty())
        {
            return;
        }

        bool all_known = true;
        std::vector<size_t> known_counts;
        for (const auto& count : counts)
        {
            all_known = all_known && count.has_value();
            known_counts.push_back(count.value_or(0));
        }
        if (all_known)
        {
            try
            {
                combination_size(tree, known_counts);
            }
            catch (const AssociationCardinalityError& e)
            {
                m_diag.add_error(ErrorCode::AssociationCardinality, location,
                                 "Step '" + step.name + "': " + e.what());
            }
        }

        space.combination_tree = std::make_shared<const CombinationNode>(std::move(tree));
    }

    // ------------------------------------------------------------------------
    // Format string scopes
    // ------------------------------------------------------------------------

    SymbolTable job_symbols() const
    {
        SymbolTable symbols;
        symbols.allow(SymbolScope::Param, m_parameter_names);
        symbols.allow(SymbolScope::RawParam, m_parameter_names);
        return symbols;
    }

    void bind_job_fields()
    {
        SymbolTable symbols = job_symbols();
        symbols.set_description("the job name may reference Param and RawParam only");
        bind_field(m_tmpl.name, symbols, "name", m_diag);
    }

    void bind_action(Action& action, const SymbolTable& symbols)
    {
        bind_field(action.command, symbols, action.location + ".command", m_diag);
        for (size_t i = 0; i < action.args.size(); ++i)
        {
            bind_field(action.args[i], symbols, action.location + ".args[" + std::to_string(i) + "]",
                       m_diag);
        }
    }

    void bind_files(std::vector<EmbeddedFile>& files, const SymbolTable& symbols)
    {
        for (auto& file : files)
        {
            bind_field(file.data, symbols, file.location + ".data", m_diag);
        }
    }

    void bind_environment(Environment& env)
    {
        SymbolTable symbols = job_symbols();
        symbols.allow_session();
        symbols.allow(SymbolScope::EnvFile,
                      env.script.has_value() ? embedded_file_names(env.script->embedded_files)
                                             : std::vector<std::string>{});
        symbols.set_description("environment '" + env.name + "'");

        for (auto& var : env.variables)
        {
            bind_field(var.value, symbols, env.location + ".variables." + var.name, m_diag);
        }
        if (!env.script.has_value())
        {
            return;
        }
        if (env.script->on_enter.has_value())
        {
            bind_action(*env.script->on_enter, symbols);
        }
        if (env.script->on_exit.has_value())
        {
            bind_action(*env.script->on_exit, symbols);
        }
        bind_files(env.script->embedded_files, symbols);
    }

    void bind_step(Step& step)
    {
        const std::vector<std::string> task_names =
            step.parameter_space.has_value() ? step.parameter_space->parameter_names()
                                             : std::vector<std::string>{};

        SymbolTable symbols = job_symbols();
        symbols.allow_session();
        symbols.allow(SymbolScope::TaskParam, task_names);
        symbols.allow(SymbolScope::TaskRawParam, task_names);
        symbols.allow(SymbolScope::TaskFile, embedded_file_names(step.script.embedded_files));
        symbols.set_description("step '" + step.name + "'");

        bind_action(step.script.on_run, symbols);
        bind_files(step.script.embedded_files, symbols);

        for (auto& env : step.step_environments)
        {
            bind_environment(env);
        }
    }
};

} // namespace

void check_job_template(JobTemplate& tmpl, Diagnostics& diagnostics)
{
    TemplateChecker checker(tmpl, diagnostics);
    checker.run();
}

namespace
{

ValidationResult finish(ParseResult parsed)
{
    ValidationResult result;
    result.diagnostics = std::move(parsed.diagnostics);
    if (!parsed.job_template)
    {
        return result;
    }

    check_job_template(*parsed.job_template, result.diagnostics);
    if (result.diagnostics.has_errors())
    {
        JOBTMPL_LOG_DEBUG("Template validation failed with " +
                          std::to_string(result.diagnostics.errors().size()) + " error(s)");
        return result;
    }

    result.job_template = std::move(parsed.job_template);
    return result;
}

} // namespace

ValidationResult validate(const std::string& document)
{
    return finish(parse_job_template(document));
}

ValidationResult validate_file(const std::filesystem::path& file)
{
    return finish(load_job_template(file));
}

std::shared_ptr<const JobTemplate> validate_or_throw(const std::string& document)
{
    auto result = validate(document);
    result.diagnostics.throw_if_errors();
    return result.job_template;
}

} // namespace jobtmpl
