#include <gtest/gtest.h>
#include "Shadow/Emulation/EmulationSession.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::RecordingNarrativeLog;
using testing_support::makeBlock;
using testing_support::makeKey;

TEST(EmulationSessionTests, StartFixesBothBalances)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative);

    session.start(1250);

    auto snap = session.snapshot();
    EXPECT_TRUE(snap.emulating);
    EXPECT_EQ(snap.originalBalance, 1250);
    EXPECT_EQ(snap.currentBalance, 1250);
    EXPECT_EQ(snap.mode, WritePolicyMode::Suppress);
}

TEST(EmulationSessionTests, StopKeepsStateForReview)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative);
    session.start(100);
    {
        std::lock_guard<std::mutex> guard(session.mutex());
        session.counters().readCount = 3;
        session.setCurrentBalance(40);
    }

    session.stop();

    auto snap = session.snapshot();
    EXPECT_FALSE(snap.emulating);
    EXPECT_EQ(snap.counters.readCount, 3U);
    EXPECT_EQ(snap.currentBalance, 40);
}

TEST(EmulationSessionTests, ResetClearsCountersAndLogKeepsKeysAndMode)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative, WritePolicyMode::Apply);
    session.start(900);
    {
        std::lock_guard<std::mutex> guard(session.mutex());
        session.counters().authenticateCount = 2;
        session.counters().writeCount = 1;
        TransactionLogEntry entry{4, TransactionOperation::Write, makeBlock({0x10}), 0};
        EXPECT_TRUE(session.transactionLog().append(entry));
        EXPECT_EQ(session.credentials().record(1, KeyKind::A, makeKey(1, 2, 3, 4, 5, 6)), CaptureOutcome::Recorded);
        session.setCurrentBalance(16);
    }

    session.reset();

    auto snap = session.snapshot();
    EXPECT_EQ(snap.counters.authenticateCount, 0U);
    EXPECT_EQ(snap.counters.writeCount, 0U);
    EXPECT_EQ(snap.transactionCount, 0U);
    EXPECT_EQ(snap.currentBalance, 900);
    EXPECT_EQ(snap.originalBalance, 900);
    EXPECT_EQ(snap.credentialCount, 1U);
    EXPECT_EQ(snap.mode, WritePolicyMode::Apply);
    EXPECT_TRUE(snap.emulating);
}

TEST(EmulationSessionTests, TryAccessorsSkipWhileLocked)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative);
    session.start(0);

    TransactionLog logCopy;
    CredentialStore storeCopy;
    {
        std::lock_guard<std::mutex> guard(session.mutex());
        EXPECT_FALSE(session.trySnapshot().has_value());
        EXPECT_FALSE(session.tryCopyTransactionLog(logCopy));
        EXPECT_FALSE(session.tryCopyCredentials(storeCopy));
    }

    EXPECT_TRUE(session.trySnapshot().has_value());
    EXPECT_TRUE(session.tryCopyTransactionLog(logCopy));
    EXPECT_TRUE(session.tryCopyCredentials(storeCopy));
}

// Mode changes never take the session lock
TEST(EmulationSessionTests, ToggleWhileLockedDoesNotBlock)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative);

    std::lock_guard<std::mutex> guard(session.mutex());
    EXPECT_EQ(session.toggleWritePolicy(), WritePolicyMode::Apply);
    EXPECT_TRUE(session.writePolicy().allowsWrites());
    ASSERT_EQ(narrative.lines.size(), 1U);
}

TEST(EmulationSessionTests, CopiedCredentialsAreIndependent)
{
    RecordingNarrativeLog narrative;
    EmulationSession session(narrative);
    {
        std::lock_guard<std::mutex> guard(session.mutex());
        EXPECT_EQ(session.credentials().record(0, KeyKind::A, makeKey(9, 9, 9, 9, 9, 9)), CaptureOutcome::Recorded);
    }

    CredentialStore copy = session.copyCredentials();
    {
        std::lock_guard<std::mutex> guard(session.mutex());
        EXPECT_EQ(session.credentials().record(1, KeyKind::B, makeKey(8, 8, 8, 8, 8, 8)), CaptureOutcome::Recorded);
    }

    EXPECT_EQ(copy.size(), 1U);
    EXPECT_EQ(session.copyCredentials().size(), 2U);
}
