/**
 * @file test_json_codec.cpp
 * @brief Unit tests for the request/summary JSON codec.
 */

#include "codec/json_codec.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace tier_gate;

TEST(DecodeRequestTest, FullRequest) {
    auto request = decode_request(R"({
        "hooks": [
            {"id": "scan", "tier": "critical", "family": "security",
             "command": "./scan.sh", "timeoutMs": 1500},
            {"description": "docs", "priority": "low", "invocation": "./docs.sh",
             "timeout": 2.5}
        ],
        "data": {"tool": "Edit", "path": "a.cpp"}
    })");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    ASSERT_EQ(request->hooks.size(), 2u);

    const auto& scan = request->hooks[0];
    EXPECT_EQ(scan.id, "scan");
    EXPECT_EQ(scan.tier, "critical");
    EXPECT_EQ(scan.family, "security");
    EXPECT_EQ(scan.invocation, "./scan.sh");
    EXPECT_EQ(scan.timeout_ms, 1500);

    const auto& docs = request->hooks[1];
    EXPECT_FALSE(docs.id.has_value());
    EXPECT_EQ(docs.description, "docs");
    EXPECT_EQ(docs.tier, "low");
    EXPECT_EQ(docs.invocation, "./docs.sh");
    EXPECT_EQ(docs.timeout_ms, 2500);

    EXPECT_EQ(request->data["tool"], "Edit");
}

TEST(DecodeRequestTest, TimeoutMsWinsOverSeconds) {
    auto raw = decode_raw_task(nlohmann::json{{"timeoutMs", 300}, {"timeout", 10}});
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->timeout_ms, 300);
}

TEST(DecodeRequestTest, HugeTimeoutsAreClamped) {
    auto request = decode_request(R"({"hooks": [
        {"id": "ms", "timeoutMs": 1e13},
        {"id": "sec", "timeout": 1e10},
        {"id": "far", "timeoutMs": 1e300},
        {"id": "neg", "timeoutMs": -1e300}
    ]})");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    ASSERT_EQ(request->hooks.size(), 4u);
    EXPECT_EQ(request->hooks[0].timeout_ms, kMaxTaskTimeout.count());
    EXPECT_EQ(request->hooks[1].timeout_ms, kMaxTaskTimeout.count());
    EXPECT_EQ(request->hooks[2].timeout_ms, kMaxTaskTimeout.count());
    EXPECT_EQ(request->hooks[3].timeout_ms, 0);

    auto task = classify(request->hooks[3]);
    EXPECT_EQ(task.timeout, TierTimeouts{}.for_tier(Tier::Medium));
}

TEST(DecodeRequestTest, NonFiniteTimeouts) {
    auto inf = decode_raw_task(
        nlohmann::json{{"timeoutMs", std::numeric_limits<double>::infinity()}});
    ASSERT_TRUE(inf.has_value());
    EXPECT_EQ(inf->timeout_ms, kMaxTaskTimeout.count());

    auto nan = decode_raw_task(
        nlohmann::json{{"timeout", std::numeric_limits<double>::quiet_NaN()}});
    ASSERT_TRUE(nan.has_value());
    EXPECT_FALSE(nan->timeout_ms.has_value());
}

TEST(DecodeRequestTest, WrongTypedFieldsAreAbsent) {
    auto raw = decode_raw_task(nlohmann::json{{"id", 7}, {"tier", true}, {"timeoutMs", "fast"}});
    ASSERT_TRUE(raw.has_value());
    EXPECT_FALSE(raw->id.has_value());
    EXPECT_FALSE(raw->tier.has_value());
    EXPECT_FALSE(raw->timeout_ms.has_value());
}

TEST(DecodeRequestTest, MissingHooksMeansEmpty) {
    auto request = decode_request(R"({"data": {}})");
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->hooks.empty());

    auto nulled = decode_request(R"({"hooks": null})");
    ASSERT_TRUE(nulled.has_value());
    EXPECT_TRUE(nulled->hooks.empty());
    EXPECT_TRUE(nulled->data.is_object());
}

TEST(DecodeRequestTest, Errors) {
    auto bad_json = decode_request("{not json");
    ASSERT_FALSE(bad_json.has_value());
    EXPECT_NE(bad_json.error().message.find("JSON parse error"), std::string::npos);

    EXPECT_FALSE(decode_request("[1, 2]").has_value());
    EXPECT_FALSE(decode_request(R"({"hooks": {"id": "x"}})").has_value());

    auto bad_entry = decode_request(R"({"hooks": [{"id": "ok"}, "nope"]})");
    ASSERT_FALSE(bad_entry.has_value());
    EXPECT_EQ(bad_entry.error().message.rfind("hooks[1]:", 0), 0u);
}

TEST(EncodeTest, ResultFields) {
    ExecutionResult result;
    result.task_id = "scan";
    result.tier = Tier::High;
    result.family = "security";
    result.duration = Millis{42};
    result.outcome = Outcome::Block;
    result.exit_code = 2;
    result.output = "found a key";

    auto json = encode_result(result);
    EXPECT_EQ(json["taskId"], "scan");
    EXPECT_EQ(json["tier"], "high");
    EXPECT_EQ(json["outcome"], "block");
    EXPECT_EQ(json["durationMs"], 42);
    EXPECT_EQ(json["exitCode"], 2);
    EXPECT_EQ(json["output"], "found a key");

    result.exit_code.reset();
    EXPECT_TRUE(encode_result(result)["exitCode"].is_null());
}

TEST(EncodeTest, SummaryShape) {
    ExecutionResult a;
    a.task_id = "a";
    a.tier = Tier::Medium;
    a.outcome = Outcome::Allow;
    a.duration = Millis{30};
    ExecutionResult b = a;
    b.task_id = "b";
    b.duration = Millis{10};

    auto json = encode_summary(aggregate({a, b}));
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["blocked"], false);
    ASSERT_EQ(json["results"].size(), 2u);
    EXPECT_EQ(json["totalDurationMs"], 40);
    EXPECT_EQ(json["maxDurationMs"], 30);
    EXPECT_NEAR(json["parallelEfficiency"].get<double>(), 40.0 / 30.0, 1e-9);
    EXPECT_EQ(json["byTier"]["medium"]["allow"], 2);
    EXPECT_EQ(json["stats"]["totalTasks"], 2);
    EXPECT_TRUE(json["stats"]["byTier"].contains("medium"));
    EXPECT_FALSE(json["stats"]["byTier"].contains("critical"));

    // Stable key order for consumers diffing output
    EXPECT_EQ(json.begin().key(), "success");
}

TEST(EncodeTest, Report) {
    ValidationReport report;
    report.task_id = "x";
    report.errors.push_back("Task command is required");
    auto json = encode_report(report);
    EXPECT_EQ(json["taskId"], "x");
    EXPECT_EQ(json["valid"], false);
    EXPECT_EQ(json["errors"].size(), 1u);
    EXPECT_TRUE(json["warnings"].empty());
}

TEST(EncodeTest, ClassificationGroupsByTier) {
    TaskDescriptor scan;
    scan.id = "scan";
    scan.tier = Tier::Critical;
    scan.family = "file_hygiene";
    scan.invocation = "./scan.sh";
    scan.timeout = Millis{1500};
    TaskDescriptor docs = scan;
    docs.id = "docs";
    docs.tier = Tier::Low;
    docs.family = std::string{kUnclassifiedFamily};

    auto json = encode_classification({docs, scan});

    std::vector<std::string> keys;
    for (auto it = json.begin(); it != json.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"critical", "high", "medium", "low", "background"}));

    ASSERT_EQ(json["critical"].size(), 1u);
    const auto& entry = json["critical"][0];
    EXPECT_EQ(entry["id"], "scan");
    EXPECT_EQ(entry["command"], "./scan.sh");
    EXPECT_EQ(entry["timeoutMs"], 1500);
    EXPECT_EQ(entry["blocking"], "hard-block");
    EXPECT_EQ(entry["gating"], true);

    ASSERT_EQ(json["low"].size(), 1u);
    EXPECT_EQ(json["low"][0]["blocking"], "warning");
    EXPECT_EQ(json["low"][0]["gating"], false);
    EXPECT_TRUE(json["background"].is_array());
    EXPECT_TRUE(json["background"].empty());
}

TEST(EncodeTest, TaskStats) {
    TaskStats stats;
    stats.total = 3;
    stats.by_tier[tier_index(Tier::High)] = 2;
    stats.by_tier[tier_index(Tier::Low)] = 1;
    stats.by_family = {{"security", 2}, {"documentation", 1}};
    stats.total_timeout = Millis{9000};
    stats.average_timeout = Millis{3000};

    auto json = encode_task_stats(stats);
    EXPECT_EQ(json["total"], 3);
    EXPECT_EQ(json["byTier"]["high"], 2);
    EXPECT_EQ(json["byTier"]["critical"], 0);
    EXPECT_EQ(json["byFamily"]["security"], 2);
    EXPECT_EQ(json["totalTimeoutMs"], 9000);
    EXPECT_EQ(json["averageTimeoutMs"], 3000);
    EXPECT_EQ(json.begin().key(), "total");
}
