#pragma once

/**
 * @file handler.hpp
 * @brief Registration-time descriptor of a command handler
 *
 * make_handler inspects the handler's signature at compile time and records
 * one ParamSpec per parameter. Binding later produces one BoundArgument per
 * parameter, and the stored thunk unpacks them into the real call.
 *
 * Accepted parameter types (by value or reference):
 *   std::string, int, std::int64_t, double, bool, or a record type with
 *   static void describe(RecordSchema<T>&).
 *
 * A handler returning Result<...> is error-reporting: an error result is
 * propagated out of App::run. Any other return value is discarded.
 */

#include "cliapp/record.hpp"
#include "cliapp/result.hpp"
#include "cliapp/value.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace cliapp {

struct ParamSpec {
    Kind kind = Kind::String;
    std::shared_ptr<const RecordSchemaBase> record;  // set when kind == Record
};

struct BoundArgument {
    Value value;       // primitive parameters
    std::any record;   // record parameters
};

struct Handler {
    std::vector<ParamSpec> params;
    bool expects_error = false;
    std::string help;
    std::function<Result<void>(std::vector<BoundArgument>&)> call;

    // True when any parameter is a record ("record mode" binding)
    bool uses_records() const;
};

namespace detail {

template<typename T>
struct callable_traits : callable_traits<decltype(&T::operator())> {};

template<typename R, typename... A>
struct callable_traits<R (*)(A...)> {
    using result_type = R;
    using args = std::tuple<A...>;
};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...)> {
    using result_type = R;
    using args = std::tuple<A...>;
};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const> {
    using result_type = R;
    using args = std::tuple<A...>;
};

template<typename T>
struct is_std_function : std::false_type {};

template<typename S>
struct is_std_function<std::function<S>> : std::true_type {};

template<typename P>
using param_value_t = std::remove_cv_t<std::remove_reference_t<P>>;

template<typename P>
ParamSpec param_spec() {
    using D = param_value_t<P>;
    if constexpr (primitive_kind<D>::supported) {
        return ParamSpec{primitive_kind<D>::kind, nullptr};
    } else {
        static_assert(is_record<D>::value,
                      "handler parameters must be string, int, int64_t, double, bool "
                      "or a record type with a static describe(RecordSchema<T>&)");
        return ParamSpec{Kind::Record, schema_for<D>()};
    }
}

template<typename P>
decltype(auto) argument_as(BoundArgument& arg) {
    using D = param_value_t<P>;
    if constexpr (primitive_kind<D>::supported) {
        return std::get<D>(arg.value);
    } else {
        return std::any_cast<D&>(arg.record);
    }
}

template<typename Fn, typename... A, std::size_t... I>
Result<void> call_unpacked(Fn& fn, std::vector<BoundArgument>& args,
                           std::tuple<A...>*, std::index_sequence<I...>) {
    using R = typename callable_traits<Fn>::result_type;
    if constexpr (is_result<R>::value) {
        static_assert(std::is_same<typename R::error_type, Error>::value,
                      "error-reporting handlers must return cliapp::Result<T, cliapp::Error>");
        auto result = fn(argument_as<A>(args[I])...);
        if (result.isErr()) {
            return Result<void>::err(result.error());
        }
        return Result<void>::ok();
    } else {
        fn(argument_as<A>(args[I])...);
        return Result<void>::ok();
    }
}

template<typename Fn>
bool is_empty_callable(const Fn& fn) {
    if constexpr (std::is_pointer<Fn>::value || is_std_function<Fn>::value) {
        return !fn;
    } else {
        return false;
    }
}

template<typename... A>
std::vector<ParamSpec> param_specs(std::tuple<A...>*) {
    return {param_spec<A>()...};
}

} // namespace detail

/**
 * @brief Build a Handler from any invocable
 * @throws RegistrationError for a null function pointer or empty std::function
 */
template<typename F>
Handler make_handler(F&& fn, std::string help = "") {
    using Fn = std::decay_t<F>;
    using traits = detail::callable_traits<Fn>;
    using Args = typename traits::args;

    if (detail::is_empty_callable(fn)) {
        throw RegistrationError(Error(ErrorCode::INVALID_REGISTRATION,
                                      "handler must be a callable function"));
    }

    Handler handler;
    handler.params = detail::param_specs(static_cast<Args*>(nullptr));
    handler.expects_error = is_result<typename traits::result_type>::value;
    handler.help = std::move(help);
    handler.call = [f = Fn(std::forward<F>(fn))](std::vector<BoundArgument>& args) mutable {
        return detail::call_unpacked(f, args, static_cast<Args*>(nullptr),
                                     std::make_index_sequence<std::tuple_size<Args>::value>{});
    };
    return handler;
}

} // namespace cliapp
