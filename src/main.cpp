#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "monitor/statistics.hpp"
#include "sandbox/executor.hpp"
using namespace std;

enum exit_code {
    EXIT_EXECUTION_SUCCESS = 0,
    EXIT_EXECUTION_FAILURE = 1,
    EXIT_CALLER_ERROR = 2
};

static nlohmann::json make_error(const string &message) {
    return {{"error", runbox::to_valid_utf8(message)}};
}

/**
 * @brief 序列化响应，不合法的 UTF-8 字节被替换而不是抛出异常
 */
static string dump(const nlohmann::json &j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/**
 * @brief 执行单个程序，源代码来自文件或者标准输入
 */
static int run_once(const runbox::executor &executor, runbox::execution_request request, const string &file) {
    if (file.empty() || file == "-") {
        request.code.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    } else {
        try {
            request.code = runbox::read_file_content(file);
        } catch (std::exception &e) {
            cout << dump(make_error(e.what()), 4) << endl;
            return EXIT_CALLER_ERROR;
        }
    }

    try {
        runbox::execution_result res = executor.execute(request);
        cout << dump(runbox::make_response(res), 4) << endl;
        return runbox::is_success(res) ? EXIT_EXECUTION_SUCCESS : EXIT_EXECUTION_FAILURE;
    } catch (runbox::request_error &e) {
        cout << dump(make_error(e.what()), 4) << endl;
        return EXIT_CALLER_ERROR;
    }
}

/**
 * @brief 处理一行 JSON 请求，返回一行 JSON 响应
 * 响应中的 id 与请求中的 id 相同，便于调用者在多个 worker 乱序输出时匹配请求
 */
static nlohmann::json serve_line(const runbox::executor &executor, const string &line) {
    nlohmann::json id;
    nlohmann::json response;
    try {
        nlohmann::json j = nlohmann::json::parse(line);
        if (j.is_object() && j.count("id")) id = j.at("id");

        runbox::execution_request request = j.get<runbox::execution_request>();
        response = runbox::make_response(executor.execute(request));
    } catch (runbox::request_error &e) {
        response = make_error(e.what());
    } catch (nlohmann::json::exception &e) {
        response = make_error(string("Malformed request: ") + e.what());
    }
    if (!id.is_null()) response["id"] = id;
    return response;
}

/**
 * @brief 从标准输入逐行读取请求，交由 workers 个线程并发执行
 */
static void serve(const runbox::executor &executor, unsigned workers) {
    runbox::concurrent_queue<string> requests;
    mutex output_mut;

    vector<thread> worker_threads;
    for (unsigned i = 0; i < workers; ++i) {
        worker_threads.emplace_back([&, i] {
            LOG(INFO) << "Worker " << i << " started";
            string line;
            while (requests.pop(line)) {
                nlohmann::json response = serve_line(executor, line);
                scoped_lock guard(output_mut);
                cout << dump(response) << endl;
            }
            LOG(INFO) << "Worker " << i << " exited";
        });
    }

    string line;
    while (getline(cin, line)) {
        if (trim(line).empty()) continue;
        requests.push(line);
    }
    requests.close();

    for (auto &th : worker_threads)
        th.join();
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config,c", po::value<string>(), "load executor configuration from the given JSON file. You can either pass it from environ RUNBOX_CONFIG")
        ("runtime", po::value<string>(), "set the container runtime executable, default to docker. You can either pass it from environ RUNBOX_RUNTIME")
        ("workspace-root", po::value<string>(), "set the directory where per-execution workspaces are created. You can either pass it from environ RUNBOX_WORKDIR")
        ("max-source-bytes", po::value<size_t>(), "set the maximum size of submitted code in bytes, default to 10000")
        ("default-timeout", po::value<long>(), "set the time limit in seconds for requests without one, default to 15")
        ("max-concurrency", po::value<size_t>(), "set the maximum number of containers running at the same time, 0 for unlimited")
        ("admission", po::value<string>(), "set what happens when max-concurrency is reached: queue or reject")
        ("language,l", po::value<string>()->default_value("python"), "language of the code to execute")
        ("file,f", po::value<string>(), "file containing the code to execute, read from stdin if absent or -")
        ("timeout,t", po::value<long>(), "time limit in seconds of this execution")
        ("actor", po::value<string>()->default_value(""), "identity of the caller, recorded in execution logs")
        ("serve", "read newline-delimited JSON requests from stdin and write one JSON response per line")
        ("workers", po::value<unsigned>()->default_value(thread::hardware_concurrency()), "number of worker threads in serve mode")
        ("stats", "print execution statistics to stderr when serve mode ends")
        ("health", "check whether the container runtime is available")
        ("list-languages", "display registered languages")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_CALLER_ERROR;
    }

    if (vm.count("help")) {
        cout << "runbox: execute untrusted code inside isolated containers" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "runbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    runbox::executor_config config;
    try {
        string config_file = vm.count("config") ? vm.at("config").as<string>() : get_env("RUNBOX_CONFIG", "");
        if (!config_file.empty())
            config = runbox::load_config(config_file);

        if (vm.count("runtime")) {
            config.runtime = vm.at("runtime").as<string>();
        } else if (getenv("RUNBOX_RUNTIME")) {
            config.runtime = get_env("RUNBOX_RUNTIME", "docker");
        }

        if (vm.count("workspace-root")) {
            config.workspace_root = vm.at("workspace-root").as<string>();
        } else if (getenv("RUNBOX_WORKDIR")) {
            config.workspace_root = get_env("RUNBOX_WORKDIR", "");
        }

        if (vm.count("max-source-bytes"))
            config.max_source_bytes = vm.at("max-source-bytes").as<size_t>();

        if (vm.count("default-timeout")) {
            long timeout = vm.at("default-timeout").as<long>();
            if (timeout <= 0 || timeout > config.max_timeout.count())
                throw invalid_argument(fmt::format("default-timeout should be in (0, {}]", config.max_timeout.count()));
            config.default_timeout = chrono::seconds(timeout);
        }

        if (vm.count("max-concurrency"))
            config.max_concurrent_executions = vm.at("max-concurrency").as<size_t>();

        if (vm.count("admission"))
            config.admission = runbox::parse_admission_policy(vm.at("admission").as<string>());
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return EXIT_CALLER_ERROR;
    }

    auto statistics = make_shared<runbox::statistics_monitor>();
    runbox::executor executor(move(config), {make_shared<runbox::log_monitor>(), statistics});

    if (vm.count("list-languages")) {
        nlohmann::json languages = nlohmann::json::array();
        for (auto &id : executor.languages().languages())
            languages.push_back(nlohmann::json(executor.languages().resolve(id)));
        cout << languages.dump(4) << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("health")) {
        bool available = executor.runtime_available();
        nlohmann::json health = {
            {"status", available ? "healthy" : "unhealthy"},
            {"services", {{executor.config().runtime.filename().string(), available ? "available" : "unavailable"}}}};
        cout << health.dump(4) << endl;
        return available ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("serve")) {
        unsigned workers = max(1U, vm.at("workers").as<unsigned>());
        LOG(INFO) << "Serving requests from stdin with " << workers << " workers";
        serve(executor, workers);
        if (vm.count("stats"))
            cerr << statistics->report().dump(4) << endl;
        return EXIT_SUCCESS;
    }

    runbox::execution_request request;
    request.language = vm.at("language").as<string>();
    request.actor = vm.at("actor").as<string>();
    if (vm.count("timeout"))
        request.timeout = chrono::seconds(vm.at("timeout").as<long>());

    return run_once(executor, request, vm.count("file") ? vm.at("file").as<string>() : "");
}
