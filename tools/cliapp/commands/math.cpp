/**
 * cliapp-demo - math commands
 *
 * Positional-only handlers.
 */

#include "../common.hpp"

#include <cstdint>

namespace cliapp::demo::commands {

void setup_math(cliapp::App& app) {
    app.add("add", "Add two integers", [](int a, int b) {
        std::cout << a + b << std::endl;
    });

    app.add("mul", "Multiply two 64-bit integers", [](std::int64_t a, std::int64_t b) {
        std::cout << a * b << std::endl;
    });

    app.add("div", "Divide two numbers", [](double a, double b) -> cliapp::Result<void> {
        if (b == 0.0) {
            return fail("division by zero");
        }
        std::cout << a / b << std::endl;
        return cliapp::Result<void>::ok();
    });
}

} // namespace cliapp::demo::commands
