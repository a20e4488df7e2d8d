/**
 * cliapp-demo - remote commands
 *
 * Multi-token command paths sharing the "remote" prefix.
 */

#include "../common.hpp"

#include <map>
#include <memory>

namespace cliapp::demo::commands {

void setup_remote(cliapp::App& app) {
    // Process-lifetime store; one run() executes at most one command
    auto remotes = std::make_shared<std::map<std::string, std::string>>();
    (*remotes)["origin"] = "https://example.invalid/origin.git";

    app.add("remote", "List remotes", [remotes]() {
        for (const auto& [name, url] : *remotes) {
            std::cout << name << "\t" << url << std::endl;
        }
    });

    app.add("remote add", "Add a remote", [remotes](const std::string& name, const std::string& url)
            -> cliapp::Result<void> {
        if (remotes->count(name) != 0) {
            return fail("remote " + name + " already exists");
        }
        (*remotes)[name] = url;
        std::cout << "added " << name << std::endl;
        return cliapp::Result<void>::ok();
    });

    app.add("remote remove", "Remove a remote", [remotes](const std::string& name)
            -> cliapp::Result<void> {
        if (remotes->erase(name) == 0) {
            return fail("no such remote: " + name);
        }
        std::cout << "removed " << name << std::endl;
        return cliapp::Result<void>::ok();
    });
}

} // namespace cliapp::demo::commands
