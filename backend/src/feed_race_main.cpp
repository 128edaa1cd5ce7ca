#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "config/run_config.hpp"
#include "race/session_report.hpp"
#include "runner/race_session.hpp"
#include "util/log.hpp"

namespace {

std::string config_path(int argc, char** argv) {
    if (argc > 1) return argv[1];
    if (const char* env = std::getenv("RACE_CONFIG")) return env;
    return "config.json";
}

void write_report(const std::string& path, const SessionReport& report) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        log_error("[report] Cannot open ", path);
        return;
    }
    out << session_report_json(report) << '\n';
    if (!out) {
        log_error("[report] Write to ", path, " failed");
        return;
    }
    log_info("[report] Written to ", path);
}

} // namespace

int main(int argc, char** argv) {
    load_env_file();

    RunConfig cfg;
    const std::string path = config_path(argc, argv);
    try {
        cfg = load_run_config(path);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << path << ": " << e.what() << std::endl;
        return 2;
    }
    set_log_verbose(cfg.verbose);

    RaceSession session(cfg);

    // SIGINT / SIGTERM request a global shutdown.
    boost::asio::io_context sig_ioc{1};
    boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
    signals.async_wait([&session](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        log_warn("[signal] Caught ", signo == SIGINT ? "SIGINT" : "SIGTERM", ", stopping endpoints");
        session.request_shutdown();
    });
    std::thread sig_thread([&sig_ioc] { sig_ioc.run(); });

    session.start();
    const auto outcomes = session.wait();

    boost::system::error_code ignored;
    signals.cancel(ignored);
    sig_ioc.stop();
    sig_thread.join();

    bool all_ok = true;
    for (const auto& out : outcomes) {
        if (out.ok) {
            const auto& s = *out.summary;
            log_info("[outcome] ", out.endpoint, ": ", to_string(s.end_state),
                     ", transactions=", s.transactions,
                     ", account_updates=", s.account_updates,
                     ", decode_failures=", s.decode_failures);
        } else {
            all_ok = false;
            log_error("[outcome] ", out.endpoint, ": failed: ", out.error);
        }
    }

    if (auto report = session.report(); report && !cfg.report_path.empty()) {
        write_report(cfg.report_path, *report);
    }
    return all_ok ? 0 : 1;
}
