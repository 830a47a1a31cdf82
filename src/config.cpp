#include "config.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

// 时间限制以毫秒参与运算，上限远小于溢出的范围
const chrono::seconds MAX_TIMEOUT_LIMIT = chrono::hours(24);

admission_policy parse_admission_policy(const string &name) {
    if (name == "queue")
        return admission_policy::QUEUE;
    else if (name == "reject")
        return admission_policy::REJECT;
    else
        throw invalid_argument("Unrecognized admission policy " + name + ", expected queue or reject");
}

void from_json(const json &j, executor_config &config) {
    if (j.count("runtime"))
        config.runtime = j.at("runtime").get<string>();
    if (j.count("workspaceRoot"))
        config.workspace_root = j.at("workspaceRoot").get<string>();
    if (j.count("maxSourceBytes"))
        j.at("maxSourceBytes").get_to(config.max_source_bytes);
    if (j.count("defaultTimeoutSeconds"))
        config.default_timeout = chrono::seconds(j.at("defaultTimeoutSeconds").get<long>());
    if (j.count("maxTimeoutSeconds"))
        config.max_timeout = chrono::seconds(j.at("maxTimeoutSeconds").get<long>());
    if (j.count("memoryLimitMB"))
        j.at("memoryLimitMB").get_to(config.limits.memory_limit_mb);
    if (j.count("cpus"))
        j.at("cpus").get_to(config.limits.cpus);
    if (j.count("maxOutputBytes"))
        j.at("maxOutputBytes").get_to(config.limits.output_limit);
    if (j.count("killDelayMilliseconds"))
        config.limits.kill_delay = chrono::milliseconds(j.at("killDelayMilliseconds").get<long>());
    if (j.count("removalTimeoutMilliseconds"))
        config.limits.removal_timeout = chrono::milliseconds(j.at("removalTimeoutMilliseconds").get<long>());
    if (j.count("maxConcurrentExecutions"))
        j.at("maxConcurrentExecutions").get_to(config.max_concurrent_executions);
    if (j.count("admission"))
        config.admission = parse_admission_policy(j.at("admission").get<string>());

    if (config.default_timeout <= chrono::seconds::zero())
        throw invalid_argument("defaultTimeoutSeconds should be positive");
    if (config.max_timeout < config.default_timeout || config.max_timeout > MAX_TIMEOUT_LIMIT)
        throw invalid_argument(fmt::format("maxTimeoutSeconds should be between defaultTimeoutSeconds and {}", MAX_TIMEOUT_LIMIT.count()));
    if (config.limits.kill_delay < chrono::milliseconds::zero() || config.limits.removal_timeout <= chrono::milliseconds::zero())
        throw invalid_argument("killDelayMilliseconds should not be negative and removalTimeoutMilliseconds should be positive");
    if (config.limits.memory_limit_mb == 0 || config.limits.cpus <= 0)
        throw invalid_argument("memoryLimitMB and cpus should be positive");

    bool builtin = true;
    if (j.count("builtinLanguages"))
        j.at("builtinLanguages").get_to(builtin);

    vector<language_profile> profiles;
    if (builtin)
        profiles = language_registry::builtin_profiles();
    if (j.count("languages")) {
        for (auto &profile : j.at("languages").get<vector<language_profile>>())
            profiles.push_back(profile);
    }
    config.languages = language_registry(profiles);
}

executor_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument(fmt::format("Configuration file {} does not exist", path.string()));

    try {
        executor_config config;
        json::parse(read_file_content(path)).get_to(config);
        return config;
    } catch (json::exception &ex) {
        throw invalid_argument(fmt::format("Configuration file {} is malformed: {}", path.string(), ex.what()));
    }
}

}  // namespace runbox
