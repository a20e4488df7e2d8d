#pragma once

/**
 * @file app.hpp
 * @brief Command registration and execution
 *
 * @example
 * ```cpp
 * cliapp::App app;
 * app.add("add", "Add two numbers", [](int a, int b) { std::cout << a + b; });
 * app.add("remote add", [](const std::string& name, const std::string& url) { ... });
 *
 * auto result = app.run({"add", "2", "3"});
 * if (result.isErr()) {
 *     std::cerr << result.error().message() << "\n";
 * }
 * ```
 */

#include "cliapp/export.hpp"
#include "cliapp/handler.hpp"
#include "cliapp/options.hpp"
#include "cliapp/registry.hpp"
#include "cliapp/result.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace cliapp {

class CLIAPP_API App {
public:
    App() : App(Options{}) {}
    explicit App(Options options);

    /// App that exits the process on failure, writing to std streams
    static App with_defaults();

    /**
     * @brief Register a handler under a command path
     * @param path Whitespace-separated command name; "" registers the root
     * @throws RegistrationError when the handler or a record schema is invalid
     */
    template<typename F>
    void add(const std::string& path, F&& fn) {
        registry_.add(path, make_handler(std::forward<F>(fn)));
    }

    template<typename F>
    void add(const std::string& path, const std::string& help, F&& fn) {
        registry_.add(path, make_handler(std::forward<F>(fn), help));
    }

    /**
     * @brief Resolve, bind and invoke
     *
     * Empty input or a leading -h/--help/help prints help (root handler's if
     * one exists, otherwise the command listing). A -h/--help right after
     * the command path prints that command's help.
     */
    Result<void> run(const std::vector<std::string>& tokens);

    /// Convenience overload: tokens are argv[1..argc); argv[0] becomes the
    /// root usage name unless Options::program_name is set
    Result<void> run(int argc, const char* const* argv);

    const CommandRegistry& registry() const { return registry_; }
    const Options& options() const { return options_; }

    std::ostream& out() const;
    std::ostream& err() const;

    /// Name used in the root handler's usage line
    std::string program_name() const;

private:
    Result<void> handle_error(Error error);
    void print_help_for(const std::string& name, const Handler& handler);

    Options options_;
    CommandRegistry registry_;
    std::string argv0_;
};

} // namespace cliapp
