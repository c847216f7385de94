/**
 * @file session.cpp
 */
#include "jobtmpl/session/session.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/session/action_output.hpp"
#include "jobtmpl/session/embedded_files.hpp"
#include "jobtmpl/session/process_runner.hpp"

#include <fstream>

#include <unistd.h>

namespace jobtmpl
{

namespace fs = std::filesystem;

namespace
{

constexpr const char* k_path_mapping_file = "path_mapping.json";
constexpr const char* k_embedded_files_dir = "embedded_files";

std::atomic<uint64_t> g_session_counter{0};

fs::path unique_session_directory(const fs::path& root)
{
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    while (true)
    {
        const uint64_t n = g_session_counter.fetch_add(1, std::memory_order_relaxed);
        fs::path candidate = root / ("session-" + std::to_string(::getpid()) + "-" +
                                     std::to_string(stamp) + "-" + std::to_string(n));
        std::error_code ec;
        if (!fs::exists(candidate, ec))
        {
            return candidate;
        }
    }
}

std::string command_line(const ProcessSpec& spec)
{
    std::string text = spec.command;
    for (const auto& arg : spec.args)
    {
        text += " " + arg;
    }
    return text;
}

std::vector<std::string> path_strings(const std::vector<fs::path>& paths)
{
    std::vector<std::string> result;
    result.reserve(paths.size());
    for (const auto& path : paths)
    {
        result.push_back(path.string());
    }
    return result;
}

} // namespace

// ============================================================================
// Construction and control
// ============================================================================

Session::Session(std::shared_ptr<const Job> job, SessionPlan plan, SessionConfig config)
    : m_job(std::move(job))
    , m_plan(std::move(plan))
    , m_config(std::move(config))
{
    if (!m_job)
    {
        throw ValidationError("Session requires a Job");
    }
    const auto& tmpl = m_job->job_template();
    if (m_plan.step_idx >= tmpl.steps.size())
    {
        throw ValidationError("Session plan names step index " + std::to_string(m_plan.step_idx) +
                              " but the template has " + std::to_string(tmpl.steps.size()) + " step(s)");
    }

    // Malformed rules fail here, before any Session work starts
    m_path_mapper = std::make_shared<const PathMapper>(m_config.path_mapping_rules, m_config.host_format);

    for (const auto& env : tmpl.job_environments)
    {
        m_environments.push_back(&env);
    }
    for (const auto& env : tmpl.steps[m_plan.step_idx].step_environments)
    {
        m_environments.push_back(&env);
    }

    if (m_config.session_root.empty())
    {
        m_config.session_root = fs::temp_directory_path();
    }
}

void Session::cancel() noexcept
{
    if (!m_cancel_requested.exchange(true, std::memory_order_acq_rel))
    {
        JOBTMPL_LOG_INFO("Cancel requested for session on step index " + std::to_string(m_plan.step_idx));
    }
}

void Session::set_state(SessionState state)
{
    m_state.store(state, std::memory_order_release);
    JOBTMPL_LOG_DEBUG(std::string("Session state -> ") + to_string(state));
    SessionEvent event;
    event.kind = SessionEventKind::StateChanged;
    event.state = state;
    emit(std::move(event));
}

void Session::emit(SessionEvent event)
{
    event.state = m_state.load(std::memory_order_acquire);
    if (m_config.on_event)
    {
        try
        {
            m_config.on_event(event);
        }
        catch (const std::exception& e)
        {
            JOBTMPL_LOG_WARN(std::string("Session event callback threw: ") + e.what());
        }
    }
    m_result.events.push_back(std::move(event));
}

void Session::record_failure(const std::string& message)
{
    if (m_result.failure_message.empty())
    {
        m_result.failure_message = message;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionResult Session::run()
{
    if (m_started)
    {
        throw SessionSetupError("Session::run() may only be called once");
    }
    m_started = true;

    const auto start = std::chrono::steady_clock::now();
    const Step& step = m_job->job_template().steps[m_plan.step_idx];
    JOBTMPL_LOG_INFO("Session starting for step '" + step.name + "' with " +
                     std::to_string(m_plan.task_runs.size()) + " task(s)");

    set_state(SessionState::Initializing);
    bool setup_ok = true;
    try
    {
        initialize();
    }
    catch (const std::exception& e)
    {
        setup_ok = false;
        m_result.setup_failed = true;
        JOBTMPL_LOG_ERROR(std::string("Session setup failed: ") + e.what());
        record_failure(std::string("Session setup failed: ") + e.what());
    }

    bool environments_ok = false;
    if (setup_ok)
    {
        SessionContext root(m_working_directory, m_path_mapper, m_config.inherit_process_environment);
        set_state(SessionState::EnteringEnvironments);
        std::vector<SessionContext> entered = enter_environments(root);
        environments_ok = entered.size() == m_environments.size();

        if (environments_ok)
        {
            set_state(SessionState::Ready);
            run_tasks(entered.empty() ? root : entered.back());
        }

        set_state(SessionState::ExitingEnvironments);
        exit_environments(entered);
    }

    // Tasks that never started are reported as canceled
    for (size_t i = m_result.tasks.size(); i < m_plan.task_runs.size(); ++i)
    {
        TaskReport report;
        report.task_index = i;
        report.parameters = describe_task_run(step, m_plan.task_runs[i]);
        report.status = TaskStatus::Canceled;
        report.failure_message = "Task did not run";
        m_result.tasks.push_back(std::move(report));
        ++m_result.tasks_canceled;
    }

    cleanup();

    m_result.success = setup_ok && environments_ok && m_result.failure_message.empty() &&
                       m_result.tasks_failed == 0 && m_result.tasks_canceled == 0;
    m_result.final_state = m_result.success ? SessionState::EndedSuccess : SessionState::EndedFailed;
    m_result.duration = std::chrono::steady_clock::now() - start;
    set_state(m_result.final_state);

    SessionEvent ended;
    ended.kind = SessionEventKind::SessionEnded;
    ended.text = m_result.summary();
    emit(std::move(ended));

    if (m_result.success)
    {
        JOBTMPL_LOG_INFO(m_result.summary());
    }
    else
    {
        JOBTMPL_LOG_WARN(m_result.summary());
    }
    return m_result;
}

void Session::initialize()
{
    m_working_directory = unique_session_directory(m_config.session_root);
    create_private_directory(m_working_directory);
    JOBTMPL_LOG_DEBUG("Session working directory: " + m_working_directory.string());

    std::string rules_file;
    if (!m_path_mapper->empty())
    {
        const fs::path path = m_working_directory / k_path_mapping_file;
        std::ofstream out(path, std::ios::trunc);
        out << emit_path_mapping_rules(m_path_mapper->rules());
        out.close();
        if (!out)
        {
            throw SessionSetupError("Cannot write path mapping rules to '" + path.string() + "'");
        }
        std::error_code ec;
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        rules_file = path.string();
    }

    m_base_values = std::make_unique<SymbolValues>(m_job->session_scope_values(*m_path_mapper));
    m_base_values->set_session_value(SessionSymbol::WorkingDirectory, m_working_directory.string());
    m_base_values->set_session_value(SessionSymbol::HasPathMappingRules,
                                     m_path_mapper->empty() ? "false" : "true");
    m_base_values->set_session_value(SessionSymbol::PathMappingRulesFile, rules_file);

    for (size_t k = 0; k < m_environments.size(); ++k)
    {
        auto values = std::make_unique<SymbolValues>(m_base_values.get());
        if (m_environments[k]->script.has_value())
        {
            const auto& files = m_environments[k]->script->embedded_files;
            const auto paths = plan_embedded_file_paths(
                files, m_working_directory / k_embedded_files_dir / ("env" + std::to_string(k)));
            values->set_values(SymbolScope::EnvFile, path_strings(paths));
            write_embedded_files(files, paths, *values);
        }
        m_environment_values.push_back(std::move(values));
    }
}

std::vector<SessionContext> Session::enter_environments(const SessionContext& root)
{
    std::vector<SessionContext> entered;
    for (size_t k = 0; k < m_environments.size(); ++k)
    {
        const Environment& env = *m_environments[k];
        const SessionContext& below = entered.empty() ? root : entered.back();

        if (cancel_requested())
        {
            record_failure("Session canceled while entering environment '" + env.name + "'");
            break;
        }

        EnvironmentFrame frame;
        frame.environment_name = env.name;
        try
        {
            for (const auto& var : env.variables)
            {
                frame.variables[var.name] = resolve(var.value, *m_environment_values[k],
                                                    "variable '" + var.name + "' of environment '" +
                                                        env.name + "'");
            }
        }
        catch (const UnresolvedReferenceError& e)
        {
            JOBTMPL_LOG_ERROR(e.what());
            record_failure(e.what());
            break;
        }

        if (env.script.has_value() && env.script->on_enter.has_value())
        {
            const SessionContext during = below.push_frame(frame);
            ActionResult result = run_action(*env.script->on_enter, "onEnter", *m_environment_values[k],
                                             during, &frame, env.name, std::nullopt, &m_cancel_requested);
            if (result.status != ActionStatus::Success)
            {
                record_failure("Environment '" + env.name + "' onEnter " + to_string(result.status) +
                               (result.failure_message.empty() ? "" : ": " + result.failure_message));
                break;
            }
        }

        entered.push_back(below.push_frame(std::move(frame)));
        SessionEvent event;
        event.kind = SessionEventKind::EnvironmentEntered;
        event.environment = env.name;
        emit(std::move(event));
        JOBTMPL_LOG_INFO("Entered environment '" + env.name + "'");
    }
    return entered;
}

void Session::run_tasks(const SessionContext& context)
{
    for (size_t i = 0; i < m_plan.task_runs.size(); ++i)
    {
        if (cancel_requested())
        {
            JOBTMPL_LOG_INFO("Session canceled; skipping " + std::to_string(m_plan.task_runs.size() - i) +
                             " remaining task(s)");
            return;
        }
        set_state(SessionState::RunningTask);
        run_task(i, context);
    }
}

void Session::run_task(size_t task_index, const SessionContext& context)
{
    const Step& step = m_job->job_template().steps[m_plan.step_idx];
    const TaskRun& run = m_plan.task_runs[task_index];

    TaskReport report;
    report.task_index = task_index;
    report.parameters = describe_task_run(step, run);

    SessionEvent started;
    started.kind = SessionEventKind::TaskStarted;
    started.task_index = task_index;
    started.parameters = report.parameters;
    emit(std::move(started));
    JOBTMPL_LOG_INFO("Task #" + std::to_string(task_index) + " of step '" + step.name + "' started [" +
                     report.parameters + "]");

    SymbolValues values(m_base_values.get());
    std::vector<std::string> mapped;
    mapped.reserve(run.values.size());
    for (TaskParamIdx h = 0; h < run.values.size(); ++h)
    {
        const bool is_path = step.parameter_space.has_value() &&
                             step.parameter_space->task_parameter_definitions[h].type == ParameterType::Path;
        mapped.push_back(is_path ? m_path_mapper->translate(run.values[h]) : run.values[h]);
    }
    values.set_values(SymbolScope::TaskParam, std::move(mapped));
    values.set_values(SymbolScope::TaskRawParam, run.values);

    bool files_ok = true;
    try
    {
        const auto& files = step.script.embedded_files;
        const auto paths = plan_embedded_file_paths(
            files, m_working_directory / k_embedded_files_dir / ("task" + std::to_string(task_index)));
        values.set_values(SymbolScope::TaskFile, path_strings(paths));
        write_embedded_files(files, paths, values);
    }
    catch (const JobTemplateError& e)
    {
        files_ok = false;
        report.status = TaskStatus::Failed;
        report.failure_message = e.what();
        JOBTMPL_LOG_ERROR("Task #" + std::to_string(task_index) + ": " + e.what());
    }

    if (files_ok)
    {
        ActionResult result = run_action(step.script.on_run, "onRun", values, context, nullptr,
                                         std::string(), task_index, &m_cancel_requested);
        switch (result.status)
        {
        case ActionStatus::Success:
            report.status = TaskStatus::Success;
            break;
        case ActionStatus::Canceled:
            report.status = TaskStatus::Canceled;
            break;
        case ActionStatus::Failed:
        case ActionStatus::Timeout:
            report.status = TaskStatus::Failed;
            break;
        }
        report.failure_message = result.failure_message;
        report.actions.push_back(std::move(result));
    }

    if (report.status != TaskStatus::Success)
    {
        record_failure("Task #" + std::to_string(task_index) + " [" + report.parameters + "] " +
                       to_string(report.status) +
                       (report.failure_message.empty() ? "" : ": " + report.failure_message));
    }

    switch (report.status)
    {
    case TaskStatus::Success:
        ++m_result.tasks_succeeded;
        break;
    case TaskStatus::Failed:
        ++m_result.tasks_failed;
        break;
    case TaskStatus::Canceled:
        ++m_result.tasks_canceled;
        break;
    }

    SessionEvent completed;
    completed.kind = SessionEventKind::TaskCompleted;
    completed.task_index = task_index;
    completed.parameters = report.parameters;
    completed.task_status = report.status;
    completed.text = report.failure_message;
    emit(std::move(completed));

    m_result.tasks.push_back(std::move(report));
}

void Session::exit_environments(const std::vector<SessionContext>& entered)
{
    for (size_t n = entered.size(); n-- > 0;)
    {
        const Environment& env = *m_environments[n];
        if (env.script.has_value() && env.script->on_exit.has_value())
        {
            // Cleanup is never canceled: no cancel flag is passed
            ActionResult result = run_action(*env.script->on_exit, "onExit", *m_environment_values[n],
                                             entered[n], nullptr, env.name, std::nullopt, nullptr);
            if (result.status != ActionStatus::Success)
            {
                record_failure("Environment '" + env.name + "' onExit " + to_string(result.status) +
                               (result.failure_message.empty() ? "" : ": " + result.failure_message));
            }
        }

        SessionEvent event;
        event.kind = SessionEventKind::EnvironmentExited;
        event.environment = env.name;
        emit(std::move(event));
        JOBTMPL_LOG_INFO("Exited environment '" + env.name + "'");
    }
}

void Session::cleanup()
{
    if (m_working_directory.empty())
    {
        return;
    }
    std::error_code ec;
    fs::remove_all(m_working_directory, ec);
    if (ec)
    {
        JOBTMPL_LOG_WARN("Cannot remove session directory '" + m_working_directory.string() +
                         "': " + ec.message());
    }
}

// ============================================================================
// Actions
// ============================================================================

ActionResult Session::run_action(const Action& action, const std::string& label, const SymbolValues& values,
                                 const SessionContext& context, EnvironmentFrame* frame,
                                 const std::string& environment, std::optional<size_t> task_index,
                                 const std::atomic<bool>* cancel_flag)
{
    ActionResult result;
    result.action = label;

    auto make_event = [&](SessionEventKind kind) {
        SessionEvent event;
        event.kind = kind;
        event.environment = environment;
        event.task_index = task_index;
        event.action = label;
        return event;
    };

    ProcessSpec spec;
    try
    {
        const std::string where = environment.empty() ? label : label + " of environment '" + environment + "'";
        spec.command = resolve(action.command, values, "command of " + where);
        for (const auto& arg : action.args)
        {
            spec.args.push_back(resolve(arg, values, "argument of " + where));
        }
    }
    catch (const UnresolvedReferenceError& e)
    {
        result.status = ActionStatus::Failed;
        result.failure_message = e.what();
        JOBTMPL_LOG_ERROR(e.what());
        SessionEvent event = make_event(SessionEventKind::ActionCompleted);
        event.action_status = result.status;
        event.text = result.failure_message;
        emit(std::move(event));
        return result;
    }

    spec.working_directory = context.working_directory();
    spec.environment = context.environment_block();
    if (action.timeout.has_value())
    {
        spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*action.timeout);
    }
    spec.cancelation = action.cancelation;

    SessionEvent started = make_event(SessionEventKind::ActionStarted);
    started.text = command_line(spec);
    emit(std::move(started));
    JOBTMPL_LOG_INFO("Running " + label + ": " + command_line(spec));

    auto on_line = [&](const std::string& line) {
        SessionEvent output = make_event(SessionEventKind::ActionOutput);
        output.text = line;
        emit(std::move(output));

        if (!m_config.output_directives)
        {
            return;
        }
        const OutputDirective directive = parse_output_directive(line);
        switch (directive.kind)
        {
        case DirectiveKind::None:
            break;
        case DirectiveKind::SetEnv:
        case DirectiveKind::UnsetEnv:
            if (frame == nullptr)
            {
                JOBTMPL_LOG_WARN("Ignoring environment directive outside onEnter: " + line);
                break;
            }
            if (directive.kind == DirectiveKind::SetEnv)
            {
                frame->variables[directive.name] = directive.text;
            }
            else
            {
                frame->variables[directive.name] = std::nullopt;
            }
            break;
        case DirectiveKind::Progress:
        {
            SessionEvent progress = make_event(SessionEventKind::ActionProgress);
            progress.progress = directive.progress;
            emit(std::move(progress));
            break;
        }
        case DirectiveKind::Status:
        {
            SessionEvent status = make_event(SessionEventKind::ActionStatusMessage);
            status.text = directive.text;
            emit(std::move(status));
            break;
        }
        case DirectiveKind::Fail:
            result.failure_message = directive.text;
            break;
        case DirectiveKind::Malformed:
            JOBTMPL_LOG_WARN("Malformed output directive: " + directive.text);
            break;
        }
    };

    ProcessResult process;
    try
    {
        process = run_process(spec, on_line, cancel_flag);
    }
    catch (const SessionSetupError& e)
    {
        process.launch_error = e.what();
    }

    result.duration = process.duration;
    result.exit_code = process.exit_code;
    if (!process.launched)
    {
        result.status = ActionStatus::Failed;
        result.failure_message = process.launch_error;
    }
    else if (process.timed_out)
    {
        result.status = ActionStatus::Timeout;
        if (result.failure_message.empty())
        {
            result.failure_message = "Action exceeded its timeout of " +
                                     std::to_string(action.timeout.value_or(std::chrono::seconds(0)).count()) +
                                     "s";
        }
    }
    else if (process.canceled)
    {
        result.status = ActionStatus::Canceled;
        if (result.failure_message.empty())
        {
            result.failure_message = "Action was canceled";
        }
    }
    else if (process.succeeded())
    {
        result.status = ActionStatus::Success;
    }
    else
    {
        result.status = ActionStatus::Failed;
        if (result.failure_message.empty())
        {
            result.failure_message = process.exit_code.has_value()
                                         ? "Action exited with code " + std::to_string(*process.exit_code)
                                         : "Action was killed by signal " +
                                               std::to_string(process.term_signal.value_or(0));
        }
    }

    SessionEvent completed = make_event(SessionEventKind::ActionCompleted);
    completed.action_status = result.status;
    completed.exit_code = result.exit_code;
    if (result.status != ActionStatus::Success)
    {
        completed.text = result.failure_message;
    }
    emit(std::move(completed));

    const std::string summary = label + " " + to_string(result.status) +
                                (result.exit_code.has_value() ? " (exit " + std::to_string(*result.exit_code) + ")"
                                                              : std::string());
    if (result.status == ActionStatus::Success)
    {
        JOBTMPL_LOG_INFO(summary);
    }
    else
    {
        JOBTMPL_LOG_WARN(summary + ": " + result.failure_message);
    }
    return result;
}

SessionResult run_session(std::shared_ptr<const Job> job, SessionPlan plan, SessionConfig config)
{
    Session session(std::move(job), std::move(plan), std::move(config));
    return session.run();
}

} // namespace jobtmpl
