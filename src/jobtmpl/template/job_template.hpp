/**
 * @file job_template.hpp
 * @brief In-memory object graph of a Job Template.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"
#include "jobtmpl/expansion/combination_expr.hpp"
#include "jobtmpl/format/format_string.hpp"

namespace jobtmpl
{

/**
 * @brief The only template schema this engine accepts.
 */
inline constexpr const char* k_specification_version = "jobtemplate-2023-09";

// ============================================================================
// Job parameters
// ============================================================================

struct StringConstraints
{
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
};

struct PathConstraints
{
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<DataFlow> data_flow;
    std::optional<ObjectType> object_type;
};

struct IntConstraints
{
    std::optional<int64_t> min_value;
    std::optional<int64_t> max_value;
};

struct FloatConstraints
{
    std::optional<double> min_value;
    std::optional<double> max_value;
};

/**
 * @brief Type-specific constraint record.
 *
 * @details
 * The alternative index equals `static_cast<size_t>(ParameterType)`, so the
 * active alternative always agrees with the definition's type tag.
 */
using ParameterConstraints =
    std::variant<StringConstraints, PathConstraints, IntConstraints, FloatConstraints>;

/**
 * @brief Default-constructed constraint record for `type`.
 */
ParameterConstraints make_constraints(ParameterType type);

/**
 * @brief A job parameter declared by the template.
 */
struct JobParameterDefinition
{
    std::string name;
    ParameterType type{ParameterType::String};
    std::string description;
    ParameterConstraints constraints;
    std::vector<std::string> allowed_values;
    std::optional<std::string> default_value;
    std::string location;
};

// ============================================================================
// Scripts
// ============================================================================

enum class EmbeddedFileType
{
    Text
};

/**
 * @brief Literal file content materialized into a Session working directory.
 */
struct EmbeddedFile
{
    std::string name;
    EmbeddedFileType type{EmbeddedFileType::Text};
    /// Bare file name to use; derived from `name` when absent.
    std::optional<std::string> filename;
    bool runnable{false};
    FormatString data;
    std::string location;
};

enum class CancelationMode
{
    Terminate,
    NotifyThenTerminate
};

inline constexpr std::chrono::seconds k_default_notify_period{120};
inline constexpr std::chrono::seconds k_max_notify_period{600};
/// Largest accepted action timeout (about 68 years).
inline constexpr std::chrono::seconds k_max_action_timeout{2147483647};

struct CancelationMethod
{
    CancelationMode mode{CancelationMode::Terminate};
    /// Grace period between SIGTERM and SIGKILL for NotifyThenTerminate.
    std::chrono::seconds notify_period{k_default_notify_period};
};

/**
 * @brief One external command invocation.
 */
struct Action
{
    FormatString command;
    std::vector<FormatString> args;
    std::optional<std::chrono::seconds> timeout;
    CancelationMethod cancelation;
    std::string location;
};

struct StepScript
{
    Action on_run;
    std::vector<EmbeddedFile> embedded_files;
    std::string location;
};

struct EnvironmentScript
{
    std::optional<Action> on_enter;
    std::optional<Action> on_exit;
    std::vector<EmbeddedFile> embedded_files;
    std::string location;
};

struct EnvironmentVariable
{
    std::string name;
    FormatString value;
};

/**
 * @brief A named, stackable setup/teardown unit.
 */
struct Environment
{
    std::string name;
    std::string description;
    std::optional<EnvironmentScript> script;
    std::vector<EnvironmentVariable> variables;
    std::string location;
};

// ============================================================================
// Steps
// ============================================================================

/**
 * @brief A task parameter and the values it ranges over.
 *
 * @details
 * Exactly one of `range_values` (explicit list) or `range_expression`
 * (INT only) is used. Both hold format strings that may reference job
 * parameters; they are resolved before expansion.
 */
struct TaskParameterDefinition
{
    std::string name;
    ParameterType type{ParameterType::Int};
    std::vector<FormatString> range_values;
    std::optional<FormatString> range_expression;
    std::string location;
};

struct StepParameterSpace
{
    std::vector<TaskParameterDefinition> task_parameter_definitions;
    /// Expression text as written; absent means the product of all parameters.
    std::optional<std::string> combination;
    /// Parsed and bound expression, set by validation.
    std::shared_ptr<const CombinationNode> combination_tree;
    std::string location;

    std::vector<std::string> parameter_names() const;
};

struct StepDependency
{
    std::string depends_on;
    /// Handle of the named Step, set by validation.
    StepIdx handle{k_unbound_handle};
    std::string location;
};

struct Step
{
    std::string name;
    std::string description;
    std::vector<StepDependency> dependencies;
    std::optional<StepParameterSpace> parameter_space;
    StepScript script;
    std::vector<Environment> step_environments;
    std::string location;
};

// ============================================================================
// Template
// ============================================================================

/**
 * @brief Root of the template object graph.
 *
 * @details
 * A `JobTemplate` produced by the parser is structurally complete but not yet
 * cross-referenced. After validation succeeds it is held as
 * `std::shared_ptr<const JobTemplate>`: every format string reference, step
 * dependency and combination leaf carries a resolved handle.
 */
struct JobTemplate
{
    std::string specification_version;
    FormatString name;
    std::string description;
    std::vector<JobParameterDefinition> parameter_definitions;
    std::vector<Step> steps;
    std::vector<Environment> job_environments;

    std::optional<StepIdx> find_step(const std::string& step_name) const;
    std::optional<ParamIdx> find_parameter(const std::string& parameter_name) const;
    std::vector<std::string> parameter_names() const;
};

/**
 * @brief Names of the embedded files of a script, in declaration order.
 */
std::vector<std::string> embedded_file_names(const std::vector<EmbeddedFile>& files);

} // namespace jobtmpl
