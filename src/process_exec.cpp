#include "kiln/process_exec.hpp"

#include <format>
#include <reproc++/run.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kiln {

Result<ProcessOutput> process_exec(std::vector<std::string> args, const ProcessOptions &options) {
    if (args.empty()) {
        return fail(ErrorKind::Io, "Cannot execute empty command");
    }

    reproc::options opts;
    opts.redirect.err.type = reproc::redirect::pipe;
    opts.redirect.out.type = reproc::redirect::pipe;
    opts.stop = {
        {reproc::stop::terminate, reproc::milliseconds(2000)},
        {reproc::stop::kill, reproc::milliseconds(2000)},
    };

    if (options.working_dir) {
        opts.working_directory = options.working_dir->c_str();
    }
    if (options.timeout) {
        opts.deadline = reproc::milliseconds(options.timeout->count());
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (options.env) {
        opts.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : *options.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        opts.env.extra = env_ptrs.data();
    }

    spdlog::trace("exec: {}", join(args, " "));

    ProcessOutput output;
    reproc::sink::string sink_out(output.out);
    reproc::sink::string sink_err(output.err);
    auto [status, ec] = reproc::run(args, opts, sink_out, sink_err);

    if (ec == std::errc::timed_out) {
        Error err{.kind = ErrorKind::Io,
                  .message = std::format("{} timed out after {} ms", args.front(), options.timeout->count()),
                  .diagnostic = output.out + output.err,
                  .timed_out = true};
        return fail(std::move(err));
    }
    if (ec) {
        return fail(ErrorKind::Io, std::format("Failed to execute {}: {}", args.front(), ec.message()));
    }
    output.exit_code = status;
    return output;
}

std::vector<std::string> expand_placeholders(std::vector<std::string> args,
                                             const std::unordered_map<std::string, std::string> &values) {
    for (auto &arg : args) {
        for (const auto &[key, value] : values) {
            const std::string token = "{" + key + "}";
            for (size_t pos = arg.find(token); pos != std::string::npos; pos = arg.find(token, pos + value.size()))
                arg.replace(pos, token.size(), value);
        }
    }
    return args;
}

} // namespace kiln
