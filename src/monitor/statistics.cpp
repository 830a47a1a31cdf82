#include "monitor/statistics.hpp"
#include <cmath>

namespace runbox {
using namespace std;
using namespace nlohmann;

void statistics_monitor::end_execution(const execution_record &record) {
    scoped_lock guard(mut);
    ++total;
    if (record.success) ++successful;
    ++languages[record.language];
    ++results[record.result];
}

size_t statistics_monitor::total_executions() const {
    scoped_lock guard(mut);
    return total;
}

size_t statistics_monitor::successful_executions() const {
    scoped_lock guard(mut);
    return successful;
}

double statistics_monitor::success_rate() const {
    scoped_lock guard(mut);
    if (total == 0) return 0;
    return round(successful * 10000.0 / total) / 100;
}

size_t statistics_monitor::count(status result) const {
    scoped_lock guard(mut);
    auto it = results.find(result);
    return it == results.end() ? 0 : it->second;
}

map<string, size_t> statistics_monitor::language_usage() const {
    scoped_lock guard(mut);
    return languages;
}

json statistics_monitor::report() const {
    scoped_lock guard(mut);
    json result_counts = json::object();
    for (auto &[result, n] : results)
        result_counts[get_status_name(result)] = n;

    double rate = total == 0 ? 0 : round(successful * 10000.0 / total) / 100;
    return {{"total_executions", total},
            {"successful_executions", successful},
            {"success_rate", rate},
            {"language_usage", languages},
            {"results", result_counts}};
}

}  // namespace runbox
