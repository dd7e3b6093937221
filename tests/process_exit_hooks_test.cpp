#include "process_exit_hooks.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

using process_exit_hooks::ExitSource;

void WriteRestoredMarker() { std::fputs("desktop restored\n", stderr); }

class ProcessExitHooksTest : public ::testing::Test {
   protected:
    void SetUp() override { process_exit_hooks::ClearShutdownRequest(); }
    void TearDown() override {
        process_exit_hooks::Shutdown();
        process_exit_hooks::ClearShutdownRequest();
    }
};

TEST_F(ProcessExitHooksTest, NoRequestInitially) {
    EXPECT_FALSE(process_exit_hooks::IsShutdownRequested());
    EXPECT_EQ(process_exit_hooks::GetShutdownSource(), ExitSource::NONE);
    EXPECT_FALSE(process_exit_hooks::ShutdownRequestedFlag().load());
}

TEST_F(ProcessExitHooksTest, FirstSourceWins) {
    process_exit_hooks::RequestShutdown(ExitSource::CONSOLE_CTRL);
    process_exit_hooks::RequestShutdown(ExitSource::SIGNAL_TERMINATE);

    EXPECT_TRUE(process_exit_hooks::IsShutdownRequested());
    EXPECT_TRUE(process_exit_hooks::ShutdownRequestedFlag().load());
    EXPECT_EQ(process_exit_hooks::GetShutdownSource(), ExitSource::CONSOLE_CTRL);
}

TEST_F(ProcessExitHooksTest, InterruptSignalRequestsShutdown) {
    process_exit_hooks::Initialize(nullptr);

    std::raise(SIGINT);

    EXPECT_TRUE(process_exit_hooks::IsShutdownRequested());
    EXPECT_EQ(process_exit_hooks::GetShutdownSource(), ExitSource::SIGNAL_INTERRUPT);
}

TEST_F(ProcessExitHooksTest, TerminateSignalRequestsShutdown) {
    process_exit_hooks::Initialize(nullptr);

    std::raise(SIGTERM);

    EXPECT_TRUE(process_exit_hooks::IsShutdownRequested());
    EXPECT_EQ(process_exit_hooks::GetShutdownSource(), ExitSource::SIGNAL_TERMINATE);
}

TEST_F(ProcessExitHooksTest, HandlerStaysInstalledAfterDelivery) {
    process_exit_hooks::Initialize(nullptr);

    std::raise(SIGINT);
    process_exit_hooks::ClearShutdownRequest();
    std::raise(SIGINT);

    EXPECT_TRUE(process_exit_hooks::IsShutdownRequested());
}

TEST_F(ProcessExitHooksTest, ClearRearmsFlag) {
    process_exit_hooks::RequestShutdown(ExitSource::SIGNAL_INTERRUPT);
    process_exit_hooks::ClearShutdownRequest();

    EXPECT_FALSE(process_exit_hooks::IsShutdownRequested());
    EXPECT_EQ(process_exit_hooks::GetShutdownSource(), ExitSource::NONE);
}

TEST_F(ProcessExitHooksTest, InitializeAndShutdownAreRepeatable) {
    process_exit_hooks::Initialize(nullptr);
    process_exit_hooks::Initialize(nullptr);
    process_exit_hooks::Shutdown();
    process_exit_hooks::Shutdown();
    process_exit_hooks::NotifyRestoreComplete();

    EXPECT_FALSE(process_exit_hooks::IsShutdownRequested());
}

#ifndef _WIN32
// Runs in a child process: exit() must reach the emergency restore without going through the logger.
// Windows traces to the debugger instead of stderr.
TEST(ProcessExitHooksDeathTest, ExitRunsEmergencyRestore) {
    EXPECT_EXIT(
        {
            process_exit_hooks::Initialize(&WriteRestoredMarker);
            std::exit(0);
        },
        ::testing::ExitedWithCode(0), "Emergency desktop restore from ATEXIT");
}
#endif

TEST(ProcessExitHooksDeathTest, EmergencyRestoreCallbackRuns) {
    EXPECT_EXIT(
        {
            process_exit_hooks::Initialize(&WriteRestoredMarker);
            std::exit(0);
        },
        ::testing::ExitedWithCode(0), "desktop restored");
}

TEST(ExitSourceStringTest, NamesEverySource) {
    EXPECT_EQ(std::string(process_exit_hooks::GetExitSourceString(ExitSource::NONE)), "NONE");
    for (auto source : {ExitSource::SIGNAL_INTERRUPT, ExitSource::SIGNAL_TERMINATE, ExitSource::CONSOLE_CTRL,
                        ExitSource::ATEXIT, ExitSource::UNHANDLED_EXCEPTION}) {
        const std::string name = process_exit_hooks::GetExitSourceString(source);
        EXPECT_FALSE(name.empty());
        EXPECT_NE(name, "UNKNOWN");
    }
}

}  // anonymous namespace
