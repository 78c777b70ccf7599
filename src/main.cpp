#include <algorithm>
#include <csignal>
#include <pthread.h>
#include <thread>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "task_runner.hpp"
#include "temp_dir_registry.hpp"
#include "executors/container_registry.hpp"

using json = nlohmann::json;

// SIGINT/SIGTERM are blocked in every thread and collected here, where it is
// safe to touch the registries before exiting. Destructors do not run after
// _Exit, so live containers go first, then their bind-mount sources.
static void install_shutdown_watcher() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    std::thread([set] {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) return;
        std::cerr << "\n[evalbox] Received signal " << sig << ", removing containers and temp directories" << std::endl;
        ContainerRegistry::instance().remove_all();
        TempDirRegistry::instance().sweep();
        std::_Exit(128 + sig);
    }).detach();
}

// Very small CLI parser
struct Args {
    std::string backend;
    std::string image;
    std::string workdir;
    std::string files_path;
    std::string tasks_path;
    std::string config_path;
    double timeout_s = 0;
    int concurrency = 1;
    bool verbose = false;
    std::string command;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--backend simple|docker] [--image IMAGE] [--workdir DIR]\n"
              << "          [--timeout SECONDS] [--files FILES.json] [--config CONFIG.json]\n"
              << "          [--verbose|--quiet] -- COMMAND...\n"
              << "       " << argv0 << " --tasks TASKS.json [--concurrency N] [--config CONFIG.json]\n"
              << "\nRuns COMMAND against the staged files and prints the result as JSON.\n";
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--backend" && i + 1 < argc) { a.backend = argv[++i]; }
        else if (s == "--image" && i + 1 < argc) { a.image = argv[++i]; }
        else if (s == "--workdir" && i + 1 < argc) { a.workdir = argv[++i]; }
        else if (s == "--files" && i + 1 < argc) { a.files_path = argv[++i]; }
        else if (s == "--tasks" && i + 1 < argc) { a.tasks_path = argv[++i]; }
        else if (s == "--config" && i + 1 < argc) { a.config_path = argv[++i]; }
        else if (s == "--timeout" && i + 1 < argc) { a.timeout_s = std::atof(argv[++i]); }
        else if (s == "--concurrency" && i + 1 < argc) { a.concurrency = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--verbose") { a.verbose = true; }
        else if (s == "--quiet") { a.verbose = false; }
        else if (s == "--") {
            for (++i; i < argc; ++i) {
                if (!a.command.empty()) a.command += ' ';
                a.command += argv[i];
            }
        }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    if (a.command.empty() == a.tasks_path.empty()) {
        std::cerr << "Exactly one of COMMAND or --tasks is required\n";
        print_help(argv[0]);
        std::exit(2);
    }
    return a;
}

// Config file first, then flags on top.
static json build_defaults(const Args& a) {
    json cfg = a.config_path.empty() ? json::object() : config::load_file(a.config_path);
    if (!cfg.is_object()) throw ConfigurationError(a.config_path + " must hold a JSON object");
    if (!a.backend.empty()) cfg["backend"] = a.backend;
    if (!a.image.empty()) cfg["image"] = a.image;
    if (a.timeout_s > 0) cfg["timeout_s"] = a.timeout_s;
    if (!a.workdir.empty()) {
        // same directory role on both backends
        cfg["working_dir"] = a.workdir;
        cfg["host_dir"] = a.workdir;
    }
    return cfg;
}

int main(int argc, char** argv) {
    install_shutdown_watcher();

    auto args = parse_args(argc, argv);

    int rc = 0;
    try {
        TaskRunner runner(build_defaults(args), args.concurrency);
        if (!args.tasks_path.empty()) {
            json results = runner.run_all(config::load_file(args.tasks_path));
            for (const auto& r : results) {
                if (!r.value("ok", false)) rc = 1;
            }
            std::cout << results.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        } else {
            json task = {{"id", "cli"}, {"command", args.command}, {"silent", !args.verbose}};
            if (!args.files_path.empty()) task["files"] = config::load_file(args.files_path);
            json result = runner.run_task(task);
            if (!result.value("ok", false)) rc = 1;
            std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        }
    } catch (const EvalboxError& e) {
        std::cerr << "[evalbox] " << e.what() << std::endl;
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[evalbox] Unexpected error: " << e.what() << std::endl;
        rc = 1;
    }

    TempDirRegistry::instance().sweep();
    return rc;
}
