/**
 * @file task_expansion_tests.cpp
 * @brief Tests for expanding Steps of a Job into TaskRuns.
 */
#include <gtest/gtest.h>
#include "jobtmpl/engine.hpp"

using namespace jobtmpl;

namespace
{

const char* const k_expansion_template = R"(
specificationVersion: jobtemplate-2023-09
name: Expansion
parameterDefinitions:
  - name: FrameEnd
    type: INT
    default: 380
  - name: Chunk
    type: INT
    default: 11
  - name: Count
    type: INT
    default: 3
steps:
  - name: Chunks
    parameterSpace:
      taskParameterDefinitions:
        - name: Start
          type: INT
          range: "1-{{Param.FrameEnd}}:{{Param.Chunk}}"
        - name: End
          type: INT
          range: "{{Param.Chunk}}-{{Param.FrameEnd}}:{{Param.Chunk}},{{Param.FrameEnd}}"
      combination: (Start, End)
    script:
      actions:
        onRun:
          command: /bin/echo
  - name: Grid
    parameterSpace:
      taskParameterDefinitions:
        - name: Num
          type: INT
          range: [1, 2, 3]
        - name: Letter
          type: STRING
          range: [A, B, C]
    script:
      actions:
        onRun:
          command: /bin/echo
  - name: Single
    script:
      actions:
        onRun:
          command: /bin/echo
  - name: Mixed
    parameterSpace:
      taskParameterDefinitions:
        - name: Scale
          type: FLOAT
          range: ["0.5", "1.5"]
        - name: Eye
          type: STRING
          range: [left, right]
        - name: Frame
          type: INT
          range: "1-2"
      combination: Frame * (Scale, Eye)
    script:
      actions:
        onRun:
          command: /bin/echo
  - name: Zip
    parameterSpace:
      taskParameterDefinitions:
        - name: Index
          type: INT
          range: "1-{{Param.Count}}"
        - name: Label
          type: STRING
          range: [a, b, c]
      combination: (Index, Label)
    script:
      actions:
        onRun:
          command: /bin/echo
)";

class TaskExpansionTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_template = validate_or_throw(k_expansion_template);
    }

    std::shared_ptr<const Job> make_job(const JobParameterInputs& inputs = {})
    {
        return create_job(m_template, inputs);
    }

    std::shared_ptr<const JobTemplate> m_template;
};

} // namespace

// ============================================================================
// Chunked frame ranges
// ============================================================================

TEST_F(TaskExpansionTests, AssociatedChunks_LastPairForcedToEnd)
{
    auto runs = expand(*make_job(), "Chunks");
    ASSERT_EQ(runs.size(), 35u);
    EXPECT_EQ(runs.front().values, (std::vector<std::string>{"1", "11"}));
    EXPECT_EQ(runs[1].values, (std::vector<std::string>{"12", "22"}));
    EXPECT_EQ(runs[32].values, (std::vector<std::string>{"353", "363"}));
    EXPECT_EQ(runs[33].values, (std::vector<std::string>{"364", "374"}));
    EXPECT_EQ(runs.back().values, (std::vector<std::string>{"375", "380"}));
}

TEST_F(TaskExpansionTests, AssociatedChunks_ExactMultiple)
{
    // 1-22:11 gives 1,12; 11-22:11,22 gives 11,22 plus an extra 22, which is out of order
    EXPECT_THROW(expand(*make_job({{"FrameEnd", "22"}}), "Chunks"), RangeExpansionError);

    // 1-23:11 gives 1,12,23; 11-23:11,23 gives 11,22,23
    auto runs = expand(*make_job({{"FrameEnd", "23"}}), "Chunks");
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs.back().values, (std::vector<std::string>{"23", "23"}));
}

TEST_F(TaskExpansionTests, AssociatedChunks_OtherChunkSizes)
{
    // 1-31:5 has 7 values; 5-31:5,31 has 6 + 1
    EXPECT_EQ(expand(*make_job({{"FrameEnd", "31"}, {"Chunk", "5"}}), "Chunks").size(), 7u);
    // 1-34:5 has 7 values; 5-34:5,34 has 6 + 1
    EXPECT_EQ(expand(*make_job({{"FrameEnd", "34"}, {"Chunk", "5"}}), "Chunks").size(), 7u);
    // The extra value repeats the last stepped value 30
    EXPECT_THROW(expand(*make_job({{"FrameEnd", "30"}, {"Chunk", "5"}}), "Chunks"), RangeExpansionError);
}

TEST_F(TaskExpansionTests, Association_UnequalAtRuntime_NamesStep)
{
    EXPECT_EQ(expand(*make_job(), "Zip").size(), 3u);
    try
    {
        expand(*make_job({{"Count", "4"}}), "Zip");
        FAIL() << "Expected AssociationCardinalityError";
    }
    catch (const AssociationCardinalityError& e)
    {
        EXPECT_NE(std::string(e.what()).find("Step 'Zip'"), std::string::npos);
    }
}

// ============================================================================
// Products and plain steps
// ============================================================================

TEST_F(TaskExpansionTests, CrossProduct_NineUniqueRunsInOrder)
{
    auto runs = expand(*make_job(), "Grid");
    ASSERT_EQ(runs.size(), 9u);

    const std::vector<std::vector<std::string>> expected{
        {"1", "A"}, {"1", "B"}, {"1", "C"}, {"2", "A"}, {"2", "B"},
        {"2", "C"}, {"3", "A"}, {"3", "B"}, {"3", "C"}};
    for (size_t i = 0; i < runs.size(); ++i)
    {
        EXPECT_EQ(runs[i].values, expected[i]) << "run " << i;
    }
}

TEST_F(TaskExpansionTests, NoParameterSpace_SingleEmptyRun)
{
    auto runs = expand(*make_job(), "Single");
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_TRUE(runs[0].values.empty());
}

TEST_F(TaskExpansionTests, ProductOfAssociation_ValuesInDeclarationOrder)
{
    auto runs = expand(*make_job(), "Mixed");
    ASSERT_EQ(runs.size(), 4u);
    // Values follow declaration order: Scale, Eye, Frame
    EXPECT_EQ(runs[0].values, (std::vector<std::string>{"0.5", "left", "1"}));
    EXPECT_EQ(runs[1].values, (std::vector<std::string>{"1.5", "right", "1"}));
    EXPECT_EQ(runs[2].values, (std::vector<std::string>{"0.5", "left", "2"}));
    EXPECT_EQ(runs[3].values, (std::vector<std::string>{"1.5", "right", "2"}));
}

TEST_F(TaskExpansionTests, UnknownStep_Throws)
{
    EXPECT_THROW(expand(*make_job(), "Nope"), ValidationError);
}

TEST_F(TaskExpansionTests, Expansion_IsDeterministicAcrossValidations)
{
    auto again = validate_or_throw(k_expansion_template);
    auto job_a = make_job();
    auto job_b = create_job(again, {});
    for (const auto& step : {"Chunks", "Grid", "Single", "Mixed"})
    {
        EXPECT_EQ(expand(*job_a, step), expand(*job_b, step)) << step;
    }
}

// ============================================================================
// Overrides and descriptions
// ============================================================================

TEST_F(TaskExpansionTests, Overrides_NormalizeAndOrderByDeclaration)
{
    const Step& grid = m_template->steps[1];
    auto runs = task_runs_from_overrides(grid, {{{"Letter", "Z"}, {"Num", "007"}}});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].values, (std::vector<std::string>{"7", "Z"}));
    EXPECT_EQ(describe_task_run(grid, runs[0]), "Num=7, Letter=Z");
}

TEST_F(TaskExpansionTests, Overrides_Invalid_Throw)
{
    const Step& grid = m_template->steps[1];
    EXPECT_THROW(task_runs_from_overrides(grid, {{{"Num", "1"}}}), ValidationError);
    EXPECT_THROW(task_runs_from_overrides(grid, {{{"Num", "x"}, {"Letter", "A"}}}), ValidationError);
    EXPECT_THROW(task_runs_from_overrides(grid, {{{"Num", "1"}, {"Letter", "A"}, {"Extra", "1"}}}),
                 ValidationError);
}

TEST_F(TaskExpansionTests, DescribeTaskRun_NoParameters)
{
    EXPECT_EQ(describe_task_run(m_template->steps[2], TaskRun{}), "(no parameters)");
}
