#include "Logging.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include "net/MiniJson.h"

namespace observability {

static int g_level = 3;
static std::ostream* g_sink = nullptr;
static std::mutex g_mu;

void set_log_level(int level) { g_level = level; }

int log_level() { return g_level; }

void set_log_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_sink = sink;
}

int level_from_name(const std::string& name) {
    std::string u = name;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (u == "DEBUG") return 1;
    if (u == "INFO") return 2;
    if (u == "WARN" || u == "WARNING") return 3;
    if (u == "ERROR") return 4;
    return 0;
}

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static void log_generic(int level, const std::string& lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << now_ms() << ',';
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << net::json_escape(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << net::json_escape(p.first) << "\":";
        if (std::holds_alternative<std::string>(p.second)) {
            ss << '\"' << net::json_escape(std::get<std::string>(p.second)) << '\"';
        } else if (std::holds_alternative<int64_t>(p.second)) {
            ss << std::get<int64_t>(p.second);
        } else if (std::holds_alternative<double>(p.second)) {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(p.second);
            ss << tmp.str();
        }
    }
    ss << '}';
    std::lock_guard<std::mutex> lk(g_mu);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << ss.str() << std::endl;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(4, "ERROR", msg, fields); }

} // namespace observability
