/**
 * cliapp-demo - text commands
 *
 * "create" shows record binding: one positional field, a valued option
 * with a short alias, a flag and an optional field.
 */

#include "../common.hpp"

#include <optional>

namespace cliapp::demo::commands {

namespace {

struct CreateTextArgs {
    std::string input;
    std::string output;
    bool use_markdown = false;
    std::optional<int> width;

    static void describe(cliapp::RecordSchema<CreateTextArgs>& s) {
        s.field("Input", &CreateTextArgs::input).arg(0);
        s.field("Output", &CreateTextArgs::output)
            .long_name("--out").short_name("-o").help("Output file");
        s.field("UseMarkdown", &CreateTextArgs::use_markdown)
            .flag().long_name("--usemarkdown").help("Render as markdown");
        s.field("Width", &CreateTextArgs::width).short_name("-w").help("Wrap column");
    }
};

} // anonymous namespace

void setup_text(cliapp::App& app) {
    app.add("echo", "Print a word", [](const std::string& word) {
        std::cout << word << std::endl;
    });

    app.add("create", "Create a text file from an input", [](const CreateTextArgs& args) {
        std::cout << "input: " << args.input << std::endl;
        std::cout << "output: " << (args.output.empty() ? "-" : args.output) << std::endl;
        std::cout << "markdown: " << (args.use_markdown ? "yes" : "no") << std::endl;
        if (args.width) {
            std::cout << "width: " << *args.width << std::endl;
        }
    });
}

} // namespace cliapp::demo::commands
