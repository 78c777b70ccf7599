#include "simple_execution_env.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <cerrno>
#include <iostream>
#include <system_error>

SimpleExecutionEnv::Options SimpleExecutionEnv::Options::from_json(const json& cfg) {
    Options o;
    o.working_dir = config::get_string(cfg, "working_dir", "");
    o.shell = config::get_string(cfg, "shell", o.shell);
    o.timeout = config::get_seconds(cfg, "timeout_s", o.timeout);
    return o;
}

SimpleExecutionEnv::SimpleExecutionEnv() : SimpleExecutionEnv(Options{}) {}

SimpleExecutionEnv::SimpleExecutionEnv(Options opts)
    : FileStore(opts.working_dir), opts_(std::move(opts)) {}

RunResult SimpleExecutionEnv::run(const std::string& command, bool silent) {
    if (!silent) {
        std::cout << "\n--- Start of run ---" << std::endl;
        std::cout << "$ " << command << std::endl;
    }

    ProcessSpec spec;
    spec.argv = {opts_.shell, "-c", command};
    spec.dir = working_dir().string();
    spec.timeout = opts_.timeout;
    spec.echo = !silent;

    RunResult r;
    try {
        r = run_process(spec);
    } catch (const std::system_error& e) {
        std::error_code ec;
        if (e.code().value() == ENOENT && !std::filesystem::is_directory(working_dir(), ec)) {
            throw ExecError("working directory is gone: " + working_dir().string());
        }
        if (e.code().value() == ENOENT) {
            throw ConfigurationError("shell not found: " + opts_.shell);
        }
        throw ExecError(std::string("failed to run command: ") + e.what());
    }

    if (r.timed_out) {
        std::cerr << "[SimpleExecutionEnv] Command timed out after " << opts_.timeout.count() << " ms" << std::endl;
    }
    if (!silent) std::cout << "--- Finished run ---\n" << std::endl;
    return r;
}
