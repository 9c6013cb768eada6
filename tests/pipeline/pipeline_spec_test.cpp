#include "dtx/pipeline/pipeline_spec.hpp"

#include <gtest/gtest.h>

using dtx::pipeline::CommandSpec;
using dtx::pipeline::PipelineSpec;
using dtx::pipeline::StageRole;
using dtx::pipeline::StageSpec;
using dtx::pipeline::StreamMode;

namespace {

StageSpec make_stage(const std::string& name, StageRole role, StreamMode in, StreamMode out) {
    StageSpec stage;
    stage.name = name;
    stage.role = role;
    stage.argv = {"/bin/cat"};
    stage.stdin_mode = in;
    stage.stdout_mode = out;
    stage.stderr_mode = StreamMode::PipeOut;
    return stage;
}

PipelineSpec three_stage_spec() {
    PipelineSpec spec;
    spec.stages = {
        make_stage("producer", StageRole::Producer, StreamMode::Null, StreamMode::PipeOut),
        make_stage("meter", StageRole::Meter, StreamMode::PipeIn, StreamMode::PipeOut),
        make_stage("consumer", StageRole::Consumer, StreamMode::PipeIn, StreamMode::Null),
    };
    return spec;
}

} // namespace

TEST(PipelineSpecTest, AcceptsArchiverMeterArchiver) {
    auto spec = three_stage_spec();
    EXPECT_TRUE(spec.validate().is_ok());
    ASSERT_TRUE(spec.meter_index().has_value());
    EXPECT_EQ(*spec.meter_index(), 1u);
    EXPECT_EQ(spec.describe(), "/bin/cat | /bin/cat | /bin/cat");
}

TEST(PipelineSpecTest, RejectsSingleStage) {
    PipelineSpec spec;
    spec.stages = {make_stage("meter", StageRole::Meter, StreamMode::Null, StreamMode::Null)};
    EXPECT_TRUE(spec.validate().is_error());
}

TEST(PipelineSpecTest, RequiresExactlyOneMeter) {
    auto none = three_stage_spec();
    none.stages[1].role = StageRole::Producer;
    EXPECT_TRUE(none.validate().is_error());
    EXPECT_FALSE(none.meter_index().has_value());

    auto two = three_stage_spec();
    two.stages[2].role = StageRole::Meter;
    EXPECT_TRUE(two.validate().is_error());
    EXPECT_FALSE(two.meter_index().has_value());
}

TEST(PipelineSpecTest, RejectsBrokenWiring) {
    auto unpiped = three_stage_spec();
    unpiped.stages[1].stdin_mode = StreamMode::Null;
    EXPECT_TRUE(unpiped.validate().is_error());

    auto dangling_out = three_stage_spec();
    dangling_out.stages[2].stdout_mode = StreamMode::PipeOut;
    EXPECT_TRUE(dangling_out.validate().is_error());

    auto dangling_in = three_stage_spec();
    dangling_in.stages[0].stdin_mode = StreamMode::PipeIn;
    EXPECT_TRUE(dangling_in.validate().is_error());

    auto broken_link = three_stage_spec();
    broken_link.stages[0].stdout_mode = StreamMode::Inherit;
    EXPECT_TRUE(broken_link.validate().is_error());
}

TEST(PipelineSpecTest, MeterStderrMustBeCaptured) {
    auto spec = three_stage_spec();
    spec.stages[1].stderr_mode = StreamMode::Inherit;
    EXPECT_TRUE(spec.validate().is_error());
}

TEST(PipelineSpecTest, RejectsEmptyCommands) {
    auto empty_stage = three_stage_spec();
    empty_stage.stages[0].argv.clear();
    EXPECT_TRUE(empty_stage.validate().is_error());

    auto empty_setup = three_stage_spec();
    empty_setup.setup.push_back(CommandSpec{"mkdir", {}});
    EXPECT_TRUE(empty_setup.validate().is_error());
}
