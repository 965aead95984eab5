/**
 * @file test_engine.cpp
 * @brief Unit tests for the Engine facade with a scripted invoker.
 * @author Dimitris Kafetzis
 */

#include "engine/engine.hpp"
#include "telemetry/json_sink.hpp"

#include "fake_invoker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <vector>

using namespace tier_gate;
using tier_gate::testing::FakeInvoker;
using tier_gate::testing::ForwardingInvoker;
using tier_gate::testing::make_task;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}
    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

bool any_contains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

class EngineTest : public ::testing::Test {
protected:
    FakeInvoker invoker_;
    std::shared_ptr<std::vector<std::string>> log_lines_ = std::make_shared<std::vector<std::string>>();
    std::shared_ptr<std::vector<std::string>> events_ = std::make_shared<std::vector<std::string>>();

    std::unique_ptr<Engine> make_engine(LogLevel level = LogLevel::Info) {
        Config config = default_config();
        config.executor.thread_count = 4;
        return std::make_unique<Engine>(Engine::Options{
            .config = config,
            .log_sink = std::make_unique<CaptureSink>(log_lines_),
            .log_level = level,
            .invoker = std::make_unique<ForwardingInvoker>(invoker_),
            .metrics_sink = std::make_unique<CaptureSink>(events_),
        });
    }
};

TEST_F(EngineTest, SerializesInputOnce) {
    auto engine = make_engine();
    nlohmann::json input = {{"tool", "Write"}, {"path", "a.txt"}};

    (void)engine->execute({make_task("a", Tier::High), make_task("b", Tier::Medium)}, input);

    auto inputs = invoker_.inputs();
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(inputs[0]), input);
    EXPECT_EQ(inputs[0], inputs[1]);
}

TEST_F(EngineTest, FaultFallsBackToSequential) {
    auto engine = make_engine();
    invoker_.script("odd", Outcome::Block);

    auto summary = engine->execute({make_task("ok", Tier::Critical),
                                    make_task("odd", static_cast<Tier>(42)),
                                    make_task("bg", Tier::Background)},
                                   nlohmann::json::object());

    // Replay treats the unknown tier as medium, a non-gating tier.
    EXPECT_TRUE(summary.blocked);
    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.results[0].task_id, "ok");
    EXPECT_EQ(summary.results[1].task_id, "odd");
    EXPECT_EQ(summary.results[1].tier, Tier::Medium);
    EXPECT_EQ(summary.results[2].task_id, "bg");

    EXPECT_TRUE(any_contains(*log_lines_, "falling back to sequential"));
    EXPECT_TRUE(any_contains(*events_, "fallback_engaged"));
}

TEST_F(EngineTest, FaultPropagatesWithoutFallback) {
    auto engine = make_engine();
    RunOptions options;
    options.fallback_to_sequential = false;

    EXPECT_THROW((void)engine->execute({make_task("odd", static_cast<Tier>(42))},
                                       nlohmann::json::object(), options),
                 OrchestrationFault);
    EXPECT_TRUE(invoker_.invoked().empty());
}

TEST_F(EngineTest, FallbackFailurePropagates) {
    auto engine = make_engine();
    invoker_.throw_on("bad");
    EXPECT_THROW((void)engine->execute({make_task("bad", Tier::Medium)}, nlohmann::json::object()),
                 std::runtime_error);
}

TEST_F(EngineTest, TimeoutCapAppliesPerRun) {
    auto engine = make_engine();
    RunOptions options;
    options.timeout = Millis{250};

    (void)engine->execute({make_task("long", Tier::Low, Millis{5000}),
                           make_task("short", Tier::Low, Millis{100})},
                          nlohmann::json::object(), options);
    EXPECT_EQ(invoker_.timeout_seen("long"), Millis{250});
    EXPECT_EQ(invoker_.timeout_seen("short"), Millis{100});

    (void)engine->execute({make_task("again", Tier::Low, Millis{5000})}, nlohmann::json::object());
    EXPECT_EQ(invoker_.timeout_seen("again"), Millis{5000});
}

TEST_F(EngineTest, VerboseRaisesProgressToInfo) {
    auto engine = make_engine(LogLevel::Info);

    (void)engine->execute({make_task("a", Tier::Medium)}, nlohmann::json::object());
    EXPECT_FALSE(any_contains(*log_lines_, "concurrently"));

    RunOptions verbose;
    verbose.verbose = true;
    (void)engine->execute({make_task("a", Tier::Medium)}, nlohmann::json::object(), verbose);
    EXPECT_TRUE(any_contains(*log_lines_, "concurrently"));
    EXPECT_EQ(engine->logger().level(), LogLevel::Info);
}

TEST_F(EngineTest, RunCompletedEventIsRecorded) {
    auto engine = make_engine();
    (void)engine->execute({}, nlohmann::json::object());
    EXPECT_TRUE(any_contains(*events_, "run_completed"));
}

TEST_F(EngineTest, ConcurrentRunsAreIndependent) {
    auto engine = make_engine();
    invoker_.set_real_time(true);
    invoker_.script("veto", Outcome::Block, Millis{20});
    invoker_.script("fine", Outcome::Allow, Millis{20});

    auto blocked = std::async(std::launch::async, [&] {
        return engine->execute({make_task("veto", Tier::Critical)}, nlohmann::json::object());
    });
    auto allowed = std::async(std::launch::async, [&] {
        return engine->execute({make_task("fine", Tier::Critical)}, nlohmann::json::object());
    });

    auto a = blocked.get();
    auto b = allowed.get();
    EXPECT_TRUE(a.blocked);
    EXPECT_FALSE(b.blocked);
    ASSERT_EQ(a.results.size(), 1u);
    ASSERT_EQ(b.results.size(), 1u);
    EXPECT_EQ(a.results[0].task_id, "veto");
    EXPECT_EQ(b.results[0].task_id, "fine");
}

TEST_F(EngineTest, ConcurrentRunsDoNotQueueBehindEachOther) {
    Config config = default_config();
    config.executor.thread_count = 1;
    Engine engine(Engine::Options{
        .config = config,
        .log_sink = nullptr,
        .log_level = LogLevel::Warn,
        .invoker = std::make_unique<ForwardingInvoker>(invoker_),
        .metrics_sink = nullptr,
    });

    auto batch = [this](const std::string& prefix) {
        std::vector<TaskDescriptor> tasks;
        for (int i = 0; i < 4; ++i) {
            auto id = prefix + std::to_string(i);
            invoker_.script(id, Outcome::Allow, Millis{150});
            tasks.push_back(make_task(id, Tier::Medium));
        }
        return tasks;
    };
    auto left = batch("left");
    auto right = batch("right");
    invoker_.set_real_time(true);

    auto start = SteadyClock::now();
    auto first = std::async(std::launch::async, [&] { return engine.execute(left, {}); });
    auto second = std::async(std::launch::async, [&] { return engine.execute(right, {}); });
    auto a = first.get();
    auto b = second.get();
    auto wall = std::chrono::duration_cast<Millis>(SteadyClock::now() - start);

    EXPECT_EQ(a.results.size(), 4u);
    EXPECT_EQ(b.results.size(), 4u);
    EXPECT_EQ(invoker_.max_concurrency(), 8);
    EXPECT_LT(wall, Millis{290});
}

TEST_F(EngineTest, DefaultRunOptionsFollowConfig) {
    Config config = default_config();
    config.engine.fallback_to_sequential = false;
    config.engine.verbose = true;
    config.engine.timeout_ms = 900;
    Engine engine(Engine::Options{.config = config,
                                  .log_sink = std::make_unique<NullSink>(),
                                  .log_level = LogLevel::Info,
                                  .invoker = std::make_unique<ForwardingInvoker>(invoker_),
                                  .metrics_sink = nullptr});
    auto options = engine.default_run_options();
    EXPECT_FALSE(options.fallback_to_sequential);
    EXPECT_TRUE(options.verbose);
    ASSERT_TRUE(options.timeout.has_value());
    EXPECT_EQ(*options.timeout, Millis{900});
}

TEST(ExitCodeTest, Mapping) {
    RunSummary clean;
    EXPECT_EQ(exit_code_for(clean), 0);

    ExecutionResult failed;
    failed.outcome = Outcome::Timeout;
    EXPECT_EQ(exit_code_for(aggregate({failed})), 1);

    ExecutionResult blocked;
    blocked.outcome = Outcome::Block;
    EXPECT_EQ(exit_code_for(aggregate({failed, blocked})), 2);
}

TEST(TimeoutCapTest, NonPositiveCapIsIgnored) {
    auto tasks = apply_timeout_cap({make_task("a", Tier::Low, Millis{800})}, Millis{0});
    EXPECT_EQ(tasks[0].timeout, Millis{800});
    tasks = apply_timeout_cap({make_task("a", Tier::Low, Millis{800})}, std::nullopt);
    EXPECT_EQ(tasks[0].timeout, Millis{800});
}
