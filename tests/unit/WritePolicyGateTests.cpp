#include <gtest/gtest.h>
#include "Shadow/Emulation/WritePolicyGate.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::RecordingNarrativeLog;

TEST(WritePolicyGateTests, DefaultsToSuppress)
{
    RecordingNarrativeLog narrative;
    WritePolicyGate gate(narrative);

    EXPECT_EQ(gate.mode(), WritePolicyMode::Suppress);
    EXPECT_FALSE(gate.allowsWrites());
    EXPECT_TRUE(narrative.lines.empty());
}

TEST(WritePolicyGateTests, ToggleFlipsAndLogsOneLine)
{
    RecordingNarrativeLog narrative;
    WritePolicyGate gate(narrative);

    EXPECT_EQ(gate.toggle(), WritePolicyMode::Apply);
    EXPECT_TRUE(gate.allowsWrites());
    ASSERT_EQ(narrative.lines.size(), 1U);
    EXPECT_EQ(narrative.lines[0], "Mode: NORMAL (apply writes)");

    EXPECT_EQ(gate.toggle(), WritePolicyMode::Suppress);
    ASSERT_EQ(narrative.lines.size(), 2U);
    EXPECT_EQ(narrative.lines[1], "Mode: TESTING (ignore writes)");
}

TEST(WritePolicyGateTests, SetSameModeIsNoOp)
{
    RecordingNarrativeLog narrative;
    WritePolicyGate gate(narrative, WritePolicyMode::Apply);

    gate.set(WritePolicyMode::Apply);
    gate.set(WritePolicyMode::Apply);

    EXPECT_EQ(gate.mode(), WritePolicyMode::Apply);
    EXPECT_TRUE(narrative.lines.empty());

    gate.set(WritePolicyMode::Suppress);
    EXPECT_EQ(gate.mode(), WritePolicyMode::Suppress);
    EXPECT_EQ(narrative.lines.size(), 1U);
}

TEST(WritePolicyGateTests, ShortNames)
{
    EXPECT_EQ(WritePolicyGate::shortName(WritePolicyMode::Apply), etl::string_view("NORMAL"));
    EXPECT_EQ(WritePolicyGate::shortName(WritePolicyMode::Suppress), etl::string_view("TESTING"));
}
