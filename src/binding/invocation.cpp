#include "cliapp/invocation.hpp"
#include "cliapp/coerce.hpp"
#include "cliapp/record_binder.hpp"
#include "cliapp/text.hpp"

#include <spdlog/spdlog.h>

namespace cliapp {

namespace {

using Arguments = std::vector<BoundArgument>;

Result<Arguments> bind_record_mode(const std::string& name, const Handler& handler,
                                   const std::vector<std::string>& tokens) {
    Arguments args(handler.params.size());
    std::size_t cursor = 0;

    for (std::size_t i = 0; i < handler.params.size(); ++i) {
        const ParamSpec& param = handler.params[i];

        if (param.kind == Kind::Record) {
            std::vector<std::string> rest(tokens.begin() + static_cast<std::ptrdiff_t>(cursor),
                                          tokens.end());
            auto bound = bind_record(rest, *param.record);
            if (bound.isErr()) {
                return Result<Arguments>::err(bound.error().withContext(
                    "failed to parse record arg " + std::to_string(i + 1) + " for " + name));
            }
            args[i].record = std::move(bound.value().value);
            cursor += bound.value().consumed;
            continue;
        }

        if (cursor >= tokens.size()) {
            return Result<Arguments>::err(Error(ErrorCode::INSUFFICIENT_ARGS,
                "not enough arguments for " + name + ": want " +
                std::to_string(handler.params.size()) + ", got " + std::to_string(tokens.size())));
        }
        auto value = coerce(tokens[cursor], param.kind);
        if (value.isErr()) {
            return Result<Arguments>::err(value.error().withContext(
                "failed to parse arg " + std::to_string(i + 1) + " for " + name));
        }
        args[i].value = std::move(value.value());
        ++cursor;
    }

    if (cursor < tokens.size()) {
        spdlog::debug("{}: ignoring {} trailing token(s)", name, tokens.size() - cursor);
    }
    return Result<Arguments>::ok(std::move(args));
}

Result<Arguments> bind_positional_mode(const std::string& name, const Handler& handler,
                                       const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        if (has_prefix(token, "--")) {
            return Result<Arguments>::err(Error(ErrorCode::UNKNOWN_OPTION,
                                                "unknown option: " + token));
        }
    }
    if (tokens.size() != handler.params.size()) {
        return Result<Arguments>::err(Error(ErrorCode::ARG_COUNT_MISMATCH,
            "wrong number of arguments for " + name + ": want " +
            std::to_string(handler.params.size()) + ", got " + std::to_string(tokens.size())));
    }

    Arguments args(handler.params.size());
    for (std::size_t i = 0; i < handler.params.size(); ++i) {
        auto value = coerce(tokens[i], handler.params[i].kind);
        if (value.isErr()) {
            return Result<Arguments>::err(value.error().withContext(
                "failed to parse arg " + std::to_string(i + 1) + " for " + name));
        }
        args[i].value = std::move(value.value());
    }
    return Result<Arguments>::ok(std::move(args));
}

} // namespace

Result<std::vector<BoundArgument>> bind_arguments(const std::string& name,
                                                  const Handler& handler,
                                                  const std::vector<std::string>& tokens) {
    if (handler.uses_records()) {
        spdlog::debug("{}: binding {} token(s) in record mode", name, tokens.size());
        return bind_record_mode(name, handler, tokens);
    }
    spdlog::debug("{}: binding {} token(s) in positional mode", name, tokens.size());
    return bind_positional_mode(name, handler, tokens);
}

Result<void> invoke(const Handler& handler, std::vector<BoundArgument>& args) {
    return handler.call(args);
}

} // namespace cliapp
