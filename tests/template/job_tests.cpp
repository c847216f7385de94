/**
 * @file job_tests.cpp
 * @brief Tests for binding job parameters and creating Jobs.
 */
#include <gtest/gtest.h>
#include "jobtmpl/template/job.hpp"
#include "jobtmpl/template/template_validator.hpp"

using namespace jobtmpl;

namespace
{

const char* const k_job_template = R"YAML(
specificationVersion: jobtemplate-2023-09
name: "{{Param.Title}} ({{RawParam.Frames}} frames)"
parameterDefinitions:
  - name: Title
    type: STRING
    minLength: 1
    maxLength: 12
  - name: Frames
    type: INT
    default: 10
    minValue: 1
    maxValue: 1000
  - name: Quality
    type: FLOAT
    default: 0.5
    minValue: 0
    maxValue: 1
  - name: Mode
    type: STRING
    allowedValues: [draft, final]
    default: draft
  - name: Scene
    type: PATH
    default: /mnt/shared/demo/scene.blend
steps:
  - name: Only
    script:
      actions:
        onRun:
          command: /bin/true
)YAML";

class JobTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_template = validate_or_throw(k_job_template);
    }

    std::shared_ptr<const JobTemplate> m_template;
};

} // namespace

// ============================================================================
// Binding
// ============================================================================

TEST_F(JobTests, CreateJob_DefaultsAndName)
{
    auto job = create_job(m_template, {{"Title", "Demo"}});
    EXPECT_EQ(job->name(), "Demo (10 frames)");
    ASSERT_EQ(job->parameters().size(), 5u);
    EXPECT_EQ(job->parameter(1).text, "10");
    EXPECT_EQ(job->parameter(1).type, ParameterType::Int);
    ASSERT_NE(job->find_parameter("Mode"), nullptr);
    EXPECT_EQ(job->find_parameter("Mode")->text, "draft");
    EXPECT_EQ(job->find_parameter("Nope"), nullptr);
}

TEST_F(JobTests, CreateJob_IntIsNormalized)
{
    auto job = create_job(m_template, {{"Title", "Demo"}, {"Frames", "+0042"}});
    EXPECT_EQ(job->parameter(1).text, "42");
    EXPECT_EQ(job->parameter(1).as_int(), 42);
    EXPECT_EQ(job->name(), "Demo (42 frames)");
}

TEST_F(JobTests, CreateJob_MissingRequired_Throws)
{
    EXPECT_THROW(create_job(m_template, {}), ValidationError);
}

TEST_F(JobTests, CreateJob_UnknownInput_Throws)
{
    EXPECT_THROW(create_job(m_template, {{"Title", "Demo"}, {"Bogus", "1"}}), ValidationError);
}

TEST_F(JobTests, CreateJob_ConstraintViolations_Throw)
{
    EXPECT_THROW(create_job(m_template, {{"Title", ""}}), ValidationError);
    EXPECT_THROW(create_job(m_template, {{"Title", "far too long a title"}}), ValidationError);
    EXPECT_THROW(create_job(m_template, {{"Title", "Demo"}, {"Frames", "0"}}), ValidationError);
    EXPECT_THROW(create_job(m_template, {{"Title", "Demo"}, {"Frames", "ten"}}), ValidationError);
    EXPECT_THROW(create_job(m_template, {{"Title", "Demo"}, {"Quality", "1.5"}}), ValidationError);
    EXPECT_THROW(create_job(m_template, {{"Title", "Demo"}, {"Mode", "preview"}}), ValidationError);
}

TEST_F(JobTests, CreateJob_ErrorListsEveryProblem)
{
    try
    {
        create_job(m_template, {{"Frames", "0"}, {"Bogus", "1"}});
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        ASSERT_NE(e.diagnostics(), nullptr);
        EXPECT_EQ(e.diagnostics()->size(), 3u);
    }
}

// ============================================================================
// Scope values
// ============================================================================

TEST_F(JobTests, SessionScope_MapsPathParametersOnly)
{
    auto job = create_job(m_template, {{"Title", "/mnt/shared/demo/title"}});
    PathMapper mapper({PathMappingRule{PathFormat::Posix, "/mnt/shared/demo", "/local/demo"}}, PathFormat::Posix);
    auto values = job->session_scope_values(mapper);

    const auto scene_idx = *m_template->find_parameter("Scene");
    const auto title_idx = *m_template->find_parameter("Title");
    ASSERT_NE(values.find(SymbolScope::Param, scene_idx), nullptr);
    EXPECT_EQ(*values.find(SymbolScope::Param, scene_idx), "/local/demo/scene.blend");
    EXPECT_EQ(*values.find(SymbolScope::RawParam, scene_idx), "/mnt/shared/demo/scene.blend");
    EXPECT_EQ(*values.find(SymbolScope::Param, title_idx), "/mnt/shared/demo/title");
}

TEST_F(JobTests, JobScope_IsUnmapped)
{
    auto job = create_job(m_template, {{"Title", "Demo"}});
    auto values = job->job_scope_values();
    const auto scene_idx = *m_template->find_parameter("Scene");
    EXPECT_EQ(*values.find(SymbolScope::Param, scene_idx), "/mnt/shared/demo/scene.blend");
}

TEST_F(JobTests, Constructor_ParameterCountMismatch_Throws)
{
    EXPECT_THROW({ Job job(m_template, {}, "x"); }, ValidationError);
}
