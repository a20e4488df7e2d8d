#include "cliapp/app.hpp"
#include "cliapp/help.hpp"
#include "cliapp/invocation.hpp"
#include "cliapp/text.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

namespace cliapp {

App::App(Options options) : options_(std::move(options)) {
    if (!options_.log_level.empty() && !apply_log_level(options_.log_level)) {
        spdlog::warn("unknown log level '{}'; keeping the current level", options_.log_level);
    }
}

App App::with_defaults() {
    Options options;
    options.exit_on_failure = true;
    return App(std::move(options));
}

std::ostream& App::out() const {
    return options_.out ? *options_.out : std::cout;
}

std::ostream& App::err() const {
    return options_.err ? *options_.err : std::cerr;
}

Result<void> App::run(int argc, const char* const* argv) {
    if (argc > 0 && argv[0] != nullptr) {
        argv0_ = argv[0];
    }
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return run(tokens);
}

Result<void> App::run(const std::vector<std::string>& tokens) {
    // No input, or a leading help trigger: root usage when there is a root
    // handler, the command listing otherwise
    if (tokens.empty() || is_root_help_token(tokens.front())) {
        if (const Handler* root = registry_.root()) {
            print_help_for("", *root);
        } else {
            render_global_help(out(), registry_);
        }
        return Result<void>::ok();
    }

    auto resolved = registry_.resolve(tokens);
    if (resolved.isErr()) {
        return handle_error(resolved.error());
    }
    const auto& resolution = resolved.value();
    const Handler& handler = *resolution.handler;

    std::vector<std::string> rest(tokens.begin() + static_cast<std::ptrdiff_t>(resolution.matched),
                                  tokens.end());

    if (!rest.empty() && is_help_token(rest.front())) {
        print_help_for(resolution.matched == 0 ? "" : resolution.name, handler);
        return Result<void>::ok();
    }

    auto args = bind_arguments(resolution.name, handler, rest);
    if (args.isErr()) {
        return handle_error(args.error());
    }

    auto called = invoke(handler, args.value());
    if (called.isErr()) {
        return handle_error(called.error());
    }
    return Result<void>::ok();
}

std::string App::program_name() const {
    if (!options_.program_name.empty()) return options_.program_name;
    if (!argv0_.empty()) return argv0_;
    return "command";
}

void App::print_help_for(const std::string& name, const Handler& handler) {
    if (name.empty()) {
        render_command_help(out(), program_name(), handler, &registry_);
    } else {
        render_command_help(out(), name, handler);
    }
}

Result<void> App::handle_error(Error error) {
    if (options_.exit_on_failure) {
        spdlog::debug("exiting on failure: {} ({})", error.message(), error_code_to_string(error.code()));
        err() << error.message() << std::endl;
        if (options_.exit) {
            options_.exit(1);
        } else {
            std::exit(1);
        }
    }
    return Result<void>::err(std::move(error));
}

} // namespace cliapp
