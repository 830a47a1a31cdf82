#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/fingerprint.hpp"
#include "common/utils.hpp"
#include "sandbox/workspace.hpp"

namespace runbox {
using namespace std;

executor::executor(executor_config config, vector<shared_ptr<monitor>> monitors)
    : conf(move(config)),
      invoker(conf.runtime, conf.limits),
      monitors(move(monitors)),
      gate(conf.max_concurrent_executions) {}

const language_profile &executor::validate(const execution_request &request) const {
    const language_profile &profile = conf.languages.resolve(request.language);

    if (request.code.size() > conf.max_source_bytes)
        throw payload_too_large(request.code.size(), conf.max_source_bytes);
    if (trim(request.code).empty())
        throw invalid_request("No code provided");
    if (request.timeout && *request.timeout <= chrono::seconds::zero())
        throw invalid_request(fmt::format("Time limit should be positive, got {} seconds", request.timeout->count()));
    if (request.timeout && *request.timeout > conf.max_timeout)
        throw invalid_request(fmt::format("Time limit should not exceed {} seconds, got {} seconds", conf.max_timeout.count(), request.timeout->count()));

    return profile;
}

semaphore_permit executor::admit() const {
    if (conf.admission == admission_policy::REJECT) {
        if (!gate.try_acquire())
            throw capacity_exceeded(conf.max_concurrent_executions);
    } else {
        gate.acquire();
    }
    return semaphore_permit(gate);
}

execution_result executor::execute(const execution_request &request) const {
    const language_profile &profile = validate(request);
    chrono::seconds timeout = request.timeout.value_or(conf.default_timeout);
    string fp = fingerprint(request.code);

    semaphore_permit permit = admit();

    elapsed_time timer;

    execution_result res;
    try {
        workspace ws(conf.workspace_root, profile, request.code);
        raw_process_outcome outcome = invoker.execute(ws, profile, timeout);
        res = classify(outcome, timeout, fp);
        if (!ws.destroy())
            LOG(ERROR) << "Workspace of execution " << fp << " was not removed: " << ws.directory();
    } catch (workspace_error &ex) {
        LOG(ERROR) << "Unable to prepare workspace for " << fp << ": " << ex;
        res = make_internal_error(fmt::format("Failed to write code file: {}", ex.what()), timer.duration<chrono::milliseconds>(), fp);
    } catch (internal_error &ex) {
        LOG(ERROR) << "Execution of " << fp << " failed: " << ex;
        res = make_internal_error(fmt::format("Execution error: {}", ex.what()), timer.duration<chrono::milliseconds>(), fp);
    } catch (exception &ex) {
        LOG(ERROR) << "Execution of " << fp << " failed: " << ex.what();
        res = make_internal_error(fmt::format("Execution error: {}", ex.what()), timer.duration<chrono::milliseconds>(), fp);
    }

    LOG(INFO) << fmt::format("Execution {} [{}] finished: {}, {}ms",
                             fp, profile.id,
                             get_display_message(get_status(res)),
                             get_common(res).elapsed.count());
    report(request, profile, res);
    return res;
}

void executor::report(const execution_request &request, const language_profile &profile, const execution_result &res) const {
    execution_record record;
    record.actor = request.actor;
    record.language = profile.id;
    record.fingerprint = get_common(res).fingerprint;
    record.execution_time_seconds = get_common(res).elapsed.count() / 1000.0;
    record.success = is_success(res);
    record.result = get_status(res);

    for (auto &m : monitors) {
        try {
            m->end_execution(record);
        } catch (exception &ex) {
            LOG(WARNING) << "Monitor failed to record execution " << record.fingerprint << ": " << ex.what();
        }
    }
}

future<execution_result> executor::execute_async(execution_request request) const {
    return async(launch::async, [this, request = move(request)] {
        return execute(request);
    });
}

bool executor::runtime_available() const {
    return invoker.runtime_available();
}

const executor_config &executor::config() const {
    return conf;
}

const language_registry &executor::languages() const {
    return conf.languages;
}

}  // namespace runbox
