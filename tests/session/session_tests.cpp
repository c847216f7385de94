/**
 * @file session_tests.cpp
 * @brief Tests for the Session lifecycle against real /bin/sh actions.
 */
#include <gtest/gtest.h>
#include "jobtmpl/session/session.hpp"
#include "jobtmpl/template/template_validator.hpp"

#include <algorithm>
#include <fstream>

#include <unistd.h>

using namespace jobtmpl;
namespace fs = std::filesystem;

namespace
{

const char* const k_session_template = R"(
specificationVersion: jobtemplate-2023-09
name: Session test
parameterDefinitions:
  - name: Tag
    type: STRING
    default: demo
  - name: Scene
    type: PATH
    default: /mnt/shared/scene.blend
jobEnvironments:
  - name: Outer
    variables:
      OUTER_VAR: "outer-{{Param.Tag}}"
    script:
      actions:
        onEnter:
          command: /bin/sh
          args: ["-c", "echo outer-enter; echo jobtmpl_env: FROM_ENTER=set"]
        onExit:
          command: /bin/sh
          args: ["-c", "echo outer-exit"]
steps:
  - name: Work
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "1-3"
    stepEnvironments:
      - name: Inner
        variables:
          INNER_VAR: inner-value
        script:
          actions:
            onEnter:
              command: /bin/sh
              args: ["-c", "echo inner-enter"]
            onExit:
              command: /bin/sh
              args: ["-c", "echo inner-exit"]
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "echo frame={{Task.Param.Frame}} outer=$OUTER_VAR enter=$FROM_ENTER inner=$INNER_VAR"]
  - name: Files
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "4-5"
    script:
      actions:
        onRun:
          command: "{{Task.File.Run}}"
          args: ["{{Task.Param.Frame}}"]
      embeddedFiles:
        - name: Run
          type: TEXT
          runnable: true
          data: |
            #!/bin/sh
            echo "run $1 {{Param.Tag}}"
  - name: Flaky
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "1-3"
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "test {{Task.Param.Frame}} -ne 2"]
  - name: FailMessage
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "echo jobtmpl_fail: license unavailable; exit 1"]
  - name: Slow
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "sleep 10"]
          timeout: 1
  - name: Sleepy
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "1-3"
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "sleep 10"]
  - name: Where
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "pwd; echo dir={{Session.WorkingDirectory}}"]
  - name: Mapped
    script:
      actions:
        onRun:
          command: /bin/echo
          args: ["{{Param.Scene}}", "{{RawParam.Scene}}", "{{Session.HasPathMappingRules}}"]
  - name: Progress
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "echo jobtmpl_progress: 50; echo jobtmpl_status: halfway"]
)";

const char* const k_broken_template = R"(
specificationVersion: jobtemplate-2023-09
name: Broken environment
jobEnvironments:
  - name: Outer
    script:
      actions:
        onEnter:
          command: /bin/sh
          args: ["-c", "echo outer-enter"]
        onExit:
          command: /bin/sh
          args: ["-c", "echo outer-exit"]
  - name: Broken
    script:
      actions:
        onEnter:
          command: /bin/sh
          args: ["-c", "exit 4"]
        onExit:
          command: /bin/sh
          args: ["-c", "echo broken-exit"]
steps:
  - name: Work
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "1-3"
    script:
      actions:
        onRun:
          command: /bin/sh
          args: ["-c", "echo frame={{Task.Param.Frame}}"]
)";

std::vector<std::string> output_lines(const SessionResult& result)
{
    std::vector<std::string> lines;
    for (const auto& event : result.events)
    {
        if (event.kind == SessionEventKind::ActionOutput)
        {
            lines.push_back(event.text);
        }
    }
    return lines;
}

size_t count_events(const SessionResult& result, SessionEventKind kind)
{
    return static_cast<size_t>(std::count_if(result.events.begin(), result.events.end(),
                                             [kind](const SessionEvent& e) { return e.kind == kind; }));
}

std::ptrdiff_t position_of(const std::vector<std::string>& lines, const std::string& line)
{
    auto it = std::find(lines.begin(), lines.end(), line);
    return it == lines.end() ? -1 : std::distance(lines.begin(), it);
}

class SessionTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = fs::temp_directory_path() /
                 ("jobtmpl-session-" + std::to_string(::getpid()) + "-" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(m_root);
        fs::create_directories(m_root);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    std::shared_ptr<const Job> make_job(const char* document = k_session_template)
    {
        return create_job(validate_or_throw(document), {});
    }

    SessionPlan plan_for(const Job& job, const std::string& step_name)
    {
        SessionPlan plan;
        plan.step_idx = *job.job_template().find_step(step_name);
        plan.task_runs = expand_step(job, plan.step_idx);
        return plan;
    }

    SessionConfig config()
    {
        SessionConfig config;
        config.session_root = m_root;
        return config;
    }

    SessionResult run_step(const std::string& step_name, const char* document = k_session_template)
    {
        auto job = make_job(document);
        return run_session(job, plan_for(*job, step_name), config());
    }

    fs::path m_root;
};

} // namespace

// ============================================================================
// Successful sessions
// ============================================================================

TEST_F(SessionTests, Success_EnvironmentsAndTasksInOrder)
{
    auto result = run_step("Work");
    EXPECT_TRUE(result.success) << result.failure_message;
    EXPECT_EQ(result.final_state, SessionState::EndedSuccess);
    EXPECT_EQ(result.tasks_succeeded, 3u);
    ASSERT_EQ(result.tasks.size(), 3u);
    EXPECT_EQ(result.tasks[0].parameters, "Frame=1");
    EXPECT_EQ(result.tasks[2].parameters, "Frame=3");

    auto lines = output_lines(result);
    const auto outer_enter = position_of(lines, "outer-enter");
    const auto inner_enter = position_of(lines, "inner-enter");
    const auto frame1 = position_of(lines, "frame=1 outer=outer-demo enter=set inner=inner-value");
    const auto frame3 = position_of(lines, "frame=3 outer=outer-demo enter=set inner=inner-value");
    const auto inner_exit = position_of(lines, "inner-exit");
    const auto outer_exit = position_of(lines, "outer-exit");
    ASSERT_GE(outer_enter, 0);
    EXPECT_LT(outer_enter, inner_enter);
    EXPECT_LT(inner_enter, frame1);
    EXPECT_LT(frame1, frame3);
    EXPECT_LT(frame3, inner_exit);
    EXPECT_LT(inner_exit, outer_exit);

    EXPECT_EQ(count_events(result, SessionEventKind::EnvironmentEntered), 2u);
    EXPECT_EQ(count_events(result, SessionEventKind::EnvironmentExited), 2u);
    EXPECT_EQ(count_events(result, SessionEventKind::TaskStarted), 3u);
    EXPECT_EQ(count_events(result, SessionEventKind::TaskCompleted), 3u);
    EXPECT_EQ(result.events.back().kind, SessionEventKind::SessionEnded);
}

TEST_F(SessionTests, StateChanges_FollowLifecycle)
{
    auto result = run_step("Work");
    std::vector<SessionState> states;
    for (const auto& event : result.events)
    {
        if (event.kind == SessionEventKind::StateChanged &&
            (states.empty() || states.back() != event.state))
        {
            states.push_back(event.state);
        }
    }
    const std::vector<SessionState> expected{SessionState::Initializing, SessionState::EnteringEnvironments,
                                             SessionState::Ready,        SessionState::RunningTask,
                                             SessionState::ExitingEnvironments, SessionState::EndedSuccess};
    EXPECT_EQ(states, expected);
}

TEST_F(SessionTests, EmbeddedFiles_MaterializedPerTask)
{
    auto result = run_step("Files");
    EXPECT_TRUE(result.success) << result.failure_message;
    auto lines = output_lines(result);
    EXPECT_GE(position_of(lines, "run 4 demo"), 0);
    EXPECT_GE(position_of(lines, "run 5 demo"), 0);
}

TEST_F(SessionTests, WorkingDirectory_UsedAndRemoved)
{
    auto result = run_step("Where");
    EXPECT_TRUE(result.success) << result.failure_message;
    auto lines = output_lines(result);
    // Lines after outer-enter and the directive: pwd, then dir=
    auto dir_it = std::find_if(lines.begin(), lines.end(),
                               [](const std::string& l) { return l.rfind("dir=", 0) == 0; });
    ASSERT_NE(dir_it, lines.end());
    const std::string dir = dir_it->substr(4);
    EXPECT_EQ(fs::path(dir).parent_path(), m_root);
    EXPECT_GE(position_of(lines, dir), 0);
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(SessionTests, PathMapping_AppliesToParamOnly)
{
    auto job = make_job();
    auto cfg = config();
    cfg.path_mapping_rules.push_back(PathMappingRule{PathFormat::Posix, "/mnt/shared", "/local/assets"});
    cfg.host_format = PathFormat::Posix;
    auto result = run_session(job, plan_for(*job, "Mapped"), cfg);
    EXPECT_TRUE(result.success) << result.failure_message;
    auto lines = output_lines(result);
    EXPECT_GE(position_of(lines, "/local/assets/scene.blend /mnt/shared/scene.blend true"), 0);
}

TEST_F(SessionTests, Directives_ProgressAndStatusEvents)
{
    auto result = run_step("Progress");
    EXPECT_TRUE(result.success) << result.failure_message;
    ASSERT_EQ(count_events(result, SessionEventKind::ActionProgress), 1u);
    ASSERT_EQ(count_events(result, SessionEventKind::ActionStatusMessage), 1u);
    for (const auto& event : result.events)
    {
        if (event.kind == SessionEventKind::ActionProgress)
        {
            EXPECT_DOUBLE_EQ(event.progress, 50.0);
            EXPECT_EQ(event.task_index, std::optional<size_t>(0));
        }
        if (event.kind == SessionEventKind::ActionStatusMessage)
        {
            EXPECT_EQ(event.text, "halfway");
        }
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(SessionTests, FailedTask_DoesNotStopLaterTasks)
{
    auto result = run_step("Flaky");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.final_state, SessionState::EndedFailed);
    EXPECT_EQ(result.tasks_succeeded, 2u);
    EXPECT_EQ(result.tasks_failed, 1u);
    ASSERT_EQ(result.tasks.size(), 3u);
    EXPECT_EQ(result.tasks[1].status, TaskStatus::Failed);
    EXPECT_EQ(result.tasks[2].status, TaskStatus::Success);
    EXPECT_GE(position_of(output_lines(result), "outer-exit"), 0);
}

TEST_F(SessionTests, FailDirective_BecomesFailureMessage)
{
    auto result = run_step("FailMessage");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.tasks.size(), 1u);
    EXPECT_EQ(result.tasks[0].status, TaskStatus::Failed);
    EXPECT_EQ(result.tasks[0].failure_message, "license unavailable");
    ASSERT_EQ(result.tasks[0].actions.size(), 1u);
    EXPECT_EQ(result.tasks[0].actions[0].exit_code, std::optional<int>(1));
}

TEST_F(SessionTests, Timeout_FailsTaskAndStillExits)
{
    const auto start = std::chrono::steady_clock::now();
    auto result = run_step("Slow");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.tasks.size(), 1u);
    EXPECT_EQ(result.tasks[0].status, TaskStatus::Failed);
    ASSERT_EQ(result.tasks[0].actions.size(), 1u);
    EXPECT_EQ(result.tasks[0].actions[0].status, ActionStatus::Timeout);
    EXPECT_GE(position_of(output_lines(result), "outer-exit"), 0);
    EXPECT_LT(elapsed, std::chrono::seconds(8));
}

TEST_F(SessionTests, EnterFailure_NoTasksAndReverseExit)
{
    auto result = run_step("Work", k_broken_template);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.setup_failed);
    EXPECT_EQ(result.tasks_canceled, 3u);
    EXPECT_EQ(count_events(result, SessionEventKind::TaskStarted), 0u);
    EXPECT_EQ(count_events(result, SessionEventKind::EnvironmentEntered), 1u);
    EXPECT_EQ(count_events(result, SessionEventKind::EnvironmentExited), 1u);

    auto lines = output_lines(result);
    EXPECT_GE(position_of(lines, "outer-exit"), 0);
    EXPECT_EQ(position_of(lines, "broken-exit"), -1);
    EXPECT_NE(result.failure_message.find("Broken"), std::string::npos);
}

TEST_F(SessionTests, SetupFailure_EndsWithoutEnvironments)
{
    const fs::path blocker = m_root / "not-a-directory";
    std::ofstream(blocker) << "x";
    auto job = make_job();
    auto cfg = config();
    cfg.session_root = blocker;
    auto result = run_session(job, plan_for(*job, "Work"), cfg);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.setup_failed);
    EXPECT_EQ(result.final_state, SessionState::EndedFailed);
    EXPECT_EQ(count_events(result, SessionEventKind::EnvironmentEntered), 0u);
    EXPECT_EQ(count_events(result, SessionEventKind::ActionStarted), 0u);
    EXPECT_EQ(result.tasks_canceled, 3u);
}

// ============================================================================
// Cancelation and misuse
// ============================================================================

TEST_F(SessionTests, Cancel_SkipsRemainingTasksAndRunsExit)
{
    auto job = make_job();
    Session* running = nullptr;
    auto cfg = config();
    cfg.on_event = [&running](const SessionEvent& event) {
        if (event.kind == SessionEventKind::TaskStarted && running != nullptr)
        {
            running->cancel();
        }
    };
    Session session(job, plan_for(*job, "Sleepy"), cfg);
    running = &session;

    const auto start = std::chrono::steady_clock::now();
    auto result = session.run();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(session.cancel_requested());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.tasks_canceled, 3u);
    ASSERT_EQ(result.tasks.size(), 3u);
    EXPECT_EQ(result.tasks[0].status, TaskStatus::Canceled);
    EXPECT_EQ(count_events(result, SessionEventKind::TaskStarted), 1u);
    EXPECT_GE(position_of(output_lines(result), "outer-exit"), 0);
    EXPECT_LT(elapsed, std::chrono::seconds(8));
}

TEST_F(SessionTests, Run_Twice_Throws)
{
    auto job = make_job();
    Session session(job, plan_for(*job, "Progress"), config());
    session.run();
    EXPECT_THROW(session.run(), SessionSetupError);
}

TEST_F(SessionTests, Constructor_BadStep_Throws)
{
    auto job = make_job();
    SessionPlan plan;
    plan.step_idx = 99;
    EXPECT_THROW({ Session session(job, plan, config()); }, ValidationError);
}
