#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

static executor_config parse(const string &text) {
    return nlohmann::json::parse(text).get<executor_config>();
}

TEST(ConfigTest, DefaultTest) {
    executor_config config = parse("{}");
    EXPECT_EQ(config.runtime.string(), "docker");
    EXPECT_EQ(config.max_source_bytes, 10000u);
    EXPECT_EQ(config.default_timeout, chrono::seconds(15));
    EXPECT_EQ(config.limits.memory_limit_mb, 128u);
    EXPECT_DOUBLE_EQ(config.limits.cpus, 0.5);
    EXPECT_EQ(config.limits.kill_delay, chrono::milliseconds(100));
    EXPECT_EQ(config.limits.removal_timeout, chrono::milliseconds(5000));
    EXPECT_EQ(config.max_timeout, chrono::seconds(300));
    EXPECT_EQ(config.max_concurrent_executions, 0u);
    EXPECT_EQ(config.admission, admission_policy::QUEUE);
    EXPECT_EQ(config.languages.languages().size(), 5u);
}

TEST(ConfigTest, ParseTest) {
    executor_config config = parse(R"({
        "runtime": "/usr/local/bin/podman",
        "workspaceRoot": "/var/lib/runbox",
        "maxSourceBytes": 20000,
        "defaultTimeoutSeconds": 5,
        "memoryLimitMB": 256,
        "cpus": 1.5,
        "maxOutputBytes": 4096,
        "killDelayMilliseconds": 500,
        "removalTimeoutMilliseconds": 2000,
        "maxTimeoutSeconds": 60,
        "maxConcurrentExecutions": 4,
        "admission": "reject",
        "languages": [
            {"id": "ruby", "filename": "main.rb", "image": "ruby:3", "command": ["ruby", "{source}"]}
        ]
    })");
    EXPECT_EQ(config.runtime.string(), "/usr/local/bin/podman");
    EXPECT_EQ(config.workspace_root.string(), "/var/lib/runbox");
    EXPECT_EQ(config.max_source_bytes, 20000u);
    EXPECT_EQ(config.default_timeout, chrono::seconds(5));
    EXPECT_EQ(config.limits.memory_limit_mb, 256u);
    EXPECT_DOUBLE_EQ(config.limits.cpus, 1.5);
    EXPECT_EQ(config.limits.output_limit, 4096u);
    EXPECT_EQ(config.limits.kill_delay, chrono::milliseconds(500));
    EXPECT_EQ(config.limits.removal_timeout, chrono::milliseconds(2000));
    EXPECT_EQ(config.max_timeout, chrono::seconds(60));
    EXPECT_EQ(config.max_concurrent_executions, 4u);
    EXPECT_EQ(config.admission, admission_policy::REJECT);
    EXPECT_EQ(config.languages.languages().size(), 6u);
    EXPECT_EQ(config.languages.resolve("ruby").image, "ruby:3");
}

TEST(ConfigTest, WithoutBuiltinLanguagesTest) {
    executor_config config = parse(R"({
        "builtinLanguages": false,
        "languages": [
            {"id": "ruby", "filename": "main.rb", "image": "ruby:3", "command": ["ruby", "{source}"]}
        ]
    })");
    EXPECT_EQ(config.languages.languages(), vector<string>({"ruby"}));
    EXPECT_FALSE(config.languages.supports("python"));
}

TEST(ConfigTest, InvalidValueTest) {
    EXPECT_THROW(parse(R"({"defaultTimeoutSeconds": 0})"), invalid_argument);
    EXPECT_THROW(parse(R"({"memoryLimitMB": 0})"), invalid_argument);
    EXPECT_THROW(parse(R"({"cpus": -1})"), invalid_argument);
    EXPECT_THROW(parse(R"({"admission": "drop"})"), invalid_argument);
    EXPECT_THROW(parse(R"({"defaultTimeoutSeconds": 30, "maxTimeoutSeconds": 20})"), invalid_argument);
    EXPECT_THROW(parse(R"({"defaultTimeoutSeconds": 10000000000000000})"), invalid_argument);
    EXPECT_THROW(parse(R"({"maxTimeoutSeconds": 10000000000000000})"), invalid_argument);
    EXPECT_THROW(parse(R"({"killDelayMilliseconds": -1})"), invalid_argument);
    EXPECT_THROW(parse(R"({"removalTimeoutMilliseconds": 0})"), invalid_argument);
    EXPECT_THROW(parse(R"({"languages": [{"id": "x", "filename": "../x", "image": "i", "command": ["x"]}]})"), invalid_argument);
}

TEST(ConfigTest, LoadConfigTest) {
    fake_runtime runtime;
    fs::path file = runtime.scratch() / "runbox.json";

    EXPECT_THROW(load_config(file), invalid_argument);

    write_file_content(file, "{ not json");
    EXPECT_THROW(load_config(file), invalid_argument);

    write_file_content(file, R"({"maxConcurrentExecutions": 2})");
    EXPECT_EQ(load_config(file).max_concurrent_executions, 2u);
}

TEST(ConfigTest, AdmissionPolicyTest) {
    EXPECT_EQ(parse_admission_policy("queue"), admission_policy::QUEUE);
    EXPECT_EQ(parse_admission_policy("reject"), admission_policy::REJECT);
    EXPECT_THROW(parse_admission_policy("QUEUE"), invalid_argument);
}
