#include <gtest/gtest.h>
#include "supervisor/restart_policy.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class RestartPolicyTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string history_path;
    RestartPolicy::TimePoint t0;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() /
                    ("craftkeeper-rp-" + std::to_string(getpid()))).string();
        fs::create_directories(test_dir);
        history_path = test_dir + "/restart_history.jsonl";
        t0 = RestartPolicy::Clock::from_time_t(1700000000);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static RestartLimits limits(int max, int window, int cooldown) {
        RestartLimits l;
        l.max_restarts = max;
        l.window = std::chrono::seconds(window);
        l.cooldown = std::chrono::seconds(cooldown);
        return l;
    }

    RestartPolicy::TimePoint at(int seconds) const {
        return t0 + std::chrono::seconds(seconds);
    }

    size_t line_count() const {
        std::ifstream in(history_path);
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) ++n;
        return n;
    }
};

TEST_F(RestartPolicyTest, FreshPolicyAllows) {
    RestartPolicy policy(limits(3, 600, 60));
    EXPECT_EQ(policy.decide(at(0)), RestartDecision::Allow);
    EXPECT_EQ(policy.attempts_in_window(at(0)), 0);
    EXPECT_EQ(policy.cooldown_remaining(at(0)), 0s);
    EXPECT_FALSE(policy.last_attempt().has_value());
}

TEST_F(RestartPolicyTest, WindowLimitAndRecovery) {
    RestartPolicy policy(limits(3, 600, 60));

    for (int t : {0, 100, 200}) {
        ASSERT_TRUE(policy.can_restart(at(t))) << "t=" << t;
        policy.record_attempt(at(t), "health_dead");
        policy.record_outcome(true);
    }

    EXPECT_EQ(policy.attempts_in_window(at(250)), 3);
    EXPECT_EQ(policy.decide(at(250)), RestartDecision::LimitExceeded);
    EXPECT_FALSE(policy.can_restart(at(250)));

    // The attempt at 0 is still inside [0, 600]
    EXPECT_EQ(policy.decide(at(600)), RestartDecision::LimitExceeded);

    EXPECT_EQ(policy.attempts_in_window(at(650)), 2);
    EXPECT_TRUE(policy.can_restart(at(650)));
}

TEST_F(RestartPolicyTest, CooldownBetweenAttempts) {
    RestartPolicy policy(limits(5, 3600, 60));
    policy.record_attempt(at(0), "process_gone");

    EXPECT_EQ(policy.decide(at(10)), RestartDecision::CoolingDown);
    EXPECT_EQ(policy.cooldown_remaining(at(10)), 50s);
    EXPECT_EQ(policy.cooldown_remaining(at(0) + 59500ms), 1s);
    EXPECT_EQ(policy.decide(at(60)), RestartDecision::Allow);
    EXPECT_EQ(policy.cooldown_remaining(at(60)), 0s);
}

TEST_F(RestartPolicyTest, LimitTakesPrecedenceOverCooldown) {
    RestartPolicy policy(limits(1, 600, 60));
    policy.record_attempt(at(0), "process_gone");
    EXPECT_EQ(policy.decide(at(1)), RestartDecision::LimitExceeded);
}

TEST_F(RestartPolicyTest, ManualRestartsDoNotCount) {
    RestartPolicy policy(limits(1, 600, 60));
    policy.record_attempt(at(0), "manual", 0, false);
    policy.record_outcome(true);

    EXPECT_EQ(policy.attempts_in_window(at(1)), 0);
    EXPECT_EQ(policy.decide(at(1)), RestartDecision::Allow);
    ASSERT_EQ(policy.history().size(), 1u);
    EXPECT_FALSE(policy.history()[0].automatic);
}

TEST_F(RestartPolicyTest, OutcomeUpdatesLastRecord) {
    RestartPolicy policy(limits(5, 600, 0));
    policy.record_attempt(at(0), "a");
    policy.record_outcome(false);
    policy.record_attempt(at(10), "b", 30);

    ASSERT_EQ(policy.history().size(), 2u);
    EXPECT_EQ(policy.history()[0].outcome, RestartOutcome::Failed);
    EXPECT_EQ(policy.history()[1].outcome, RestartOutcome::Pending);
    EXPECT_EQ(policy.history()[1].cooldown_applied_seconds, 30);
    EXPECT_EQ(policy.last_attempt(), at(10));
}

TEST_F(RestartPolicyTest, OutcomeWithoutAttemptIsIgnored) {
    RestartPolicy policy(limits(5, 600, 0));
    policy.record_outcome(true);
    EXPECT_TRUE(policy.history().empty());
}

TEST_F(RestartPolicyTest, ResetClearsCountButKeepsHistory) {
    RestartPolicy policy(limits(2, 600, 60));
    policy.record_attempt(at(0), "a");
    policy.record_attempt(at(100), "b");
    EXPECT_EQ(policy.decide(at(120)), RestartDecision::LimitExceeded);

    policy.reset(at(120));
    EXPECT_EQ(policy.attempts_in_window(at(120)), 0);
    EXPECT_EQ(policy.decide(at(120)), RestartDecision::Allow);
    EXPECT_FALSE(policy.last_attempt().has_value());
    EXPECT_EQ(policy.history().size(), 2u);

    policy.record_attempt(at(130), "c");
    EXPECT_EQ(policy.attempts_in_window(at(130)), 1);
}

TEST_F(RestartPolicyTest, HistoryPersistsAcrossInstances) {
    {
        RestartPolicy policy(limits(3, 600, 60), history_path);
        ASSERT_TRUE(policy.load());
        policy.record_attempt(at(0), "health_dead", 60);
        policy.record_outcome(true);
        policy.record_attempt(at(100), "process_gone");
        policy.record_outcome(false);
    }
    EXPECT_EQ(line_count(), 4u);

    RestartPolicy reloaded(limits(3, 600, 60), history_path);
    ASSERT_TRUE(reloaded.load(at(150)));
    ASSERT_EQ(reloaded.history().size(), 2u);
    EXPECT_EQ(reloaded.history()[0].reason, "health_dead");
    EXPECT_EQ(reloaded.history()[0].outcome, RestartOutcome::Success);
    EXPECT_EQ(reloaded.history()[0].cooldown_applied_seconds, 60);
    EXPECT_EQ(reloaded.history()[1].outcome, RestartOutcome::Failed);
    EXPECT_EQ(reloaded.attempts_in_window(at(150)), 2);
    EXPECT_EQ(reloaded.last_attempt(), at(100));
}

TEST_F(RestartPolicyTest, ResetPersists) {
    {
        RestartPolicy policy(limits(1, 600, 60), history_path);
        policy.record_attempt(at(0), "a");
        policy.reset(at(10));
    }
    RestartPolicy reloaded(limits(1, 600, 60), history_path);
    ASSERT_TRUE(reloaded.load(at(20)));
    EXPECT_EQ(reloaded.decide(at(20)), RestartDecision::Allow);
}

TEST_F(RestartPolicyTest, MalformedLinesAreSkipped) {
    {
        std::ofstream out(history_path);
        out << "{\"event\":\"attempt\",\"timestamp\":1700000000000,\"reason\":\"a\",\"automatic\":true}\n";
        out << "this is not json\n";
        out << "\n";
        out << "{\"event\":\"attempt\",\"timestamp\":\"soon\"}\n";
        out << "{\"event\":\"attempt\",\"timestamp\":1700000050000,\"reason\":\"b\"}\n";
    }

    RestartPolicy policy(limits(3, 600, 60), history_path);
    ASSERT_TRUE(policy.load(at(100)));
    ASSERT_EQ(policy.history().size(), 2u);
    EXPECT_EQ(policy.history()[0].reason, "a");
    EXPECT_EQ(policy.history()[1].reason, "b");
    EXPECT_TRUE(policy.history()[1].automatic);
}

TEST_F(RestartPolicyTest, MissingHistoryFileLoadsEmpty) {
    RestartPolicy policy(limits(3, 600, 60), test_dir + "/nope/history.jsonl");
    EXPECT_TRUE(policy.load());
    EXPECT_TRUE(policy.history().empty());
}

TEST_F(RestartPolicyTest, InMemoryHistoryIsBounded) {
    RestartPolicy policy(limits(5, 600, 0));
    for (int i = 0; i < 1500; ++i) {
        policy.record_attempt(at(i), "x", 0, false);
    }
    EXPECT_EQ(policy.history().size(), 1000u);
    EXPECT_EQ(policy.history().front().timestamp, at(500).wall);
}

// ── Wall clock adjustments ──────────────────────────────────

TEST_F(RestartPolicyTest, BackwardClockStepKeepsWindowCount) {
    RestartPolicy policy(limits(3, 600, 60));
    for (int t : {0, 100, 200}) {
        policy.record_attempt(at(t), "process_gone");
        policy.record_outcome(true);
    }

    Instant stepped = at(250);
    stepped.wall -= 10min;
    EXPECT_EQ(policy.attempts_in_window(stepped), 3);
    EXPECT_EQ(policy.decide(stepped), RestartDecision::LimitExceeded);
}

TEST_F(RestartPolicyTest, BackwardClockStepDoesNotStretchCooldown) {
    RestartPolicy policy(limits(5, 3600, 60));
    policy.record_attempt(at(0), "process_gone");

    // Five minutes of real time pass while the wall clock loses an hour
    Instant later = at(300);
    later.wall = t0.wall - 1h + 5min;
    EXPECT_EQ(policy.cooldown_remaining(later), 0s);
    EXPECT_EQ(policy.decide(later), RestartDecision::Allow);

    Instant soon = at(20);
    soon.wall = t0.wall - 1h;
    EXPECT_EQ(policy.cooldown_remaining(soon), 40s);
}

TEST_F(RestartPolicyTest, ForwardClockStepDoesNotExpireWindow) {
    RestartPolicy policy(limits(1, 600, 60));
    policy.record_attempt(at(0), "process_gone");

    Instant jumped = at(30);
    jumped.wall += 24h;
    EXPECT_EQ(policy.decide(jumped), RestartDecision::LimitExceeded);
}

TEST_F(RestartPolicyTest, FutureRecordsAreClampedOnLoad) {
    {
        RestartPolicy policy(limits(3, 600, 60), history_path);
        policy.record_attempt(at(3600), "process_gone");
    }

    // The clock was stepped back an hour before the daemon restarted
    RestartPolicy reloaded(limits(3, 600, 60), history_path);
    ASSERT_TRUE(reloaded.load(at(0)));
    ASSERT_EQ(reloaded.history().size(), 1u);
    EXPECT_EQ(reloaded.history()[0].timestamp, at(3600).wall);
    EXPECT_EQ(reloaded.attempts_in_window(at(10)), 1);
    EXPECT_EQ(reloaded.cooldown_remaining(at(10)), 50s);
    EXPECT_EQ(reloaded.decide(at(60)), RestartDecision::Allow);
}

TEST_F(RestartPolicyTest, DecisionNames) {
    EXPECT_STREQ(to_string(RestartDecision::Allow), "allow");
    EXPECT_STREQ(to_string(RestartDecision::CoolingDown), "cooling_down");
    EXPECT_STREQ(to_string(RestartDecision::LimitExceeded), "limit_exceeded");
    EXPECT_STREQ(to_string(RestartOutcome::Success), "success");
}
