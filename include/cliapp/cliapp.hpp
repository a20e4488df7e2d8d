#ifndef CLIAPP_CLIAPP_HPP
#define CLIAPP_CLIAPP_HPP

/*
 * cliapp - bind command-line tokens to typed handlers
 *
 * Single include for embedding programs:
 *
 *      #include <cliapp/cliapp.hpp>
 *
 *      int main(int argc, char** argv) {
 *          auto app = cliapp::App::with_defaults();
 *          app.add("greet", [](const std::string& who) { std::cout << "hi " << who; });
 *          return app.run(argc, argv).isOk() ? 0 : 1;
 *      }
 */

#include "cliapp/result.hpp"
#include "cliapp/value.hpp"
#include "cliapp/coerce.hpp"
#include "cliapp/record.hpp"
#include "cliapp/field_table.hpp"
#include "cliapp/record_binder.hpp"
#include "cliapp/handler.hpp"
#include "cliapp/registry.hpp"
#include "cliapp/invocation.hpp"
#include "cliapp/help.hpp"
#include "cliapp/describe.hpp"
#include "cliapp/options.hpp"
#include "cliapp/app.hpp"

namespace cliapp {

constexpr const char* CLIAPP_VERSION = "0.3.0";

} // namespace cliapp

#endif // CLIAPP_CLIAPP_HPP
