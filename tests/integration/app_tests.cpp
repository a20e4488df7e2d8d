#include <doctest/doctest.h>
#include <cliapp/cliapp.hpp>

#include <spdlog/spdlog.h>

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace cliapp;

namespace {

struct CreateTextArgs {
    std::string input;
    std::string output;
    bool use_markdown = false;

    static void describe(RecordSchema<CreateTextArgs>& s) {
        s.field("Input", &CreateTextArgs::input).arg(0);
        s.field("Output", &CreateTextArgs::output).long_name("--out").short_name("-o").help("Output file");
        s.field("UseMarkdown", &CreateTextArgs::use_markdown).flag().long_name("--usemarkdown").help("Render as markdown");
    }
};

struct RootArgs {
    bool verbose = false;

    static void describe(RecordSchema<RootArgs>& s) {
        s.field("Verbose", &RootArgs::verbose).short_name("-v");
    }
};

// App writing to in-memory sinks
struct Harness {
    std::ostringstream out;
    std::ostringstream err;
    std::vector<int> exits;
    App app;

    explicit Harness(bool exit_on_failure = false) : app(make_options(exit_on_failure)) {}

private:
    Options make_options(bool exit_on_failure) {
        Options options;
        options.out = &out;
        options.err = &err;
        options.exit_on_failure = exit_on_failure;
        options.program_name = "demo";
        options.exit = [this](int code) { exits.push_back(code); };
        return options;
    }
};

} // namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("App runs a primitive command") {
    Harness h;
    int sum = 0;
    h.app.add("add", "Add two integers", [&sum](int a, int b) { sum = a + b; });

    auto result = h.app.run({"add", "2", "3"});
    CHECK(result.isOk());
    CHECK(sum == 5);
    CHECK(h.out.str().empty());
}

TEST_CASE("App binds a record command") {
    Harness h;
    std::optional<CreateTextArgs> seen;
    h.app.add("create", [&seen](const CreateTextArgs& args) { seen = args; });

    auto result = h.app.run({"create", "hello.txt", "--out=out.txt", "--usemarkdown"});
    REQUIRE(result.isOk());
    REQUIRE(seen.has_value());
    CHECK(seen->input == "hello.txt");
    CHECK(seen->output == "out.txt");
    CHECK(seen->use_markdown);
}

TEST_CASE("App prefers the longest command path") {
    Harness h;
    std::vector<std::string> calls;
    h.app.add("remote", [&calls]() { calls.push_back("remote"); });
    h.app.add("remote add", [&calls](const std::string& name, const std::string& url) {
        calls.push_back("add " + name + " " + url);
    });

    REQUIRE(h.app.run({"remote", "add", "origin", "git@host:r.git"}).isOk());
    REQUIRE(h.app.run({"remote"}).isOk());
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "add origin git@host:r.git");
    CHECK(calls[1] == "remote");
}

TEST_CASE("App falls back to the root handler") {
    Harness h;
    std::string seen;
    h.app.add("", [&seen](const std::string& s) { seen = s; });
    h.app.add("known", []() {});

    REQUIRE(h.app.run({"unmatched"}).isOk());
    CHECK(seen == "unmatched");
}

TEST_CASE("App is reusable across runs") {
    Harness h;
    int total = 0;
    h.app.add("inc", [&total](int by) { total += by; });

    for (int i = 0; i < 3; ++i) {
        REQUIRE(h.app.run({"inc", "2"}).isOk());
    }
    CHECK(total == 6);
}

TEST_CASE("App runs from argc/argv") {
    Harness h;
    std::string seen;
    h.app.add("echo", [&seen](const std::string& s) { seen = s; });

    const char* argv[] = {"demo", "echo", "hi"};
    REQUIRE(h.app.run(3, argv).isOk());
    CHECK(seen == "hi");
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("App reports binding failures without exiting") {
    Harness h;
    h.app.add("echo", [](const std::string&) {});

    SUBCASE("missing argument") {
        auto result = h.app.run({"echo"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::ARG_COUNT_MISMATCH);
    }
    SUBCASE("unknown option") {
        auto result = h.app.run({"echo", "--bogus"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::UNKNOWN_OPTION);
    }
    SUBCASE("unknown command") {
        auto result = h.app.run({"ech", "x"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::UNKNOWN_COMMAND);
        CHECK(result.error().message() == "unknown command: ech");
    }

    CHECK(h.exits.empty());
    CHECK(h.err.str().empty());
}

TEST_CASE("App propagates handler errors") {
    Harness h;
    h.app.add("div", [](double a, double b) -> Result<void> {
        if (b == 0.0) return Result<void>::err(Error(ErrorCode::HANDLER_FAILED, "division by zero"));
        (void)a;
        return Result<void>::ok();
    });

    auto result = h.app.run({"div", "1", "0"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::HANDLER_FAILED);
    CHECK(result.error().message() == "division by zero");
    CHECK(h.app.run({"div", "1", "2"}).isOk());
}

TEST_CASE("exit_on_failure writes the message and exits with 1") {
    Harness h(true);
    h.app.add("add", [](int, int) {});

    auto result = h.app.run({"add", "1", "x"});
    CHECK(result.isErr());
    REQUIRE(h.exits.size() == 1);
    CHECK(h.exits[0] == 1);
    CHECK(h.err.str() == result.error().message() + "\n");
}

TEST_CASE("exit_on_failure does not fire on success or help") {
    Harness h(true);
    h.app.add("add", [](int, int) {});

    CHECK(h.app.run({"add", "1", "2"}).isOk());
    CHECK(h.app.run({"--help"}).isOk());
    CHECK(h.app.run({"add", "-h"}).isOk());
    CHECK(h.exits.empty());
}

TEST_CASE("registration rejects an empty handler") {
    Harness h;
    void (*null_fn)() = nullptr;
    CHECK_THROWS_AS(h.app.add("broken", null_fn), RegistrationError);
    CHECK(h.app.registry().commands().empty());
}

// ============================================================================
// Help
// ============================================================================

TEST_CASE("empty input prints global help") {
    Harness h;
    h.app.add("add", "Add two integers", [](int, int) {});

    REQUIRE(h.app.run(std::vector<std::string>{}).isOk());
    CHECK(h.out.str().find("Usage: [options...]\n\nCommands:\n  add  Add two integers\n") == 0);
}

TEST_CASE("help triggers before the command") {
    for (const char* trigger : {"-h", "--help", "help"}) {
        Harness h;
        bool called = false;
        h.app.add("add", [&called](int, int) { called = true; });

        REQUIRE(h.app.run({trigger, "add", "1", "2"}).isOk());
        CHECK_FALSE(called);
        CHECK(h.out.str().find("Commands:\n") != std::string::npos);
    }
}

TEST_CASE("help after the command path prints that command's help") {
    Harness h;
    bool called = false;
    h.app.add("create", [&called](const CreateTextArgs&) { called = true; });

    REQUIRE(h.app.run({"create", "--help", "ignored"}).isOk());
    CHECK_FALSE(called);
    CHECK(h.out.str().find("Usage: create <args...> [options...]\n") == 0);
    CHECK(h.out.str().find("  -o|--out <string>    Output file\n") != std::string::npos);
}

TEST_CASE("root handler help uses the program name") {
    Harness h;
    bool called = false;
    h.app.add("", [&called](const RootArgs&) { called = true; });
    h.app.add("add", [](int, int) {});

    REQUIRE(h.app.run(std::vector<std::string>{}).isOk());
    CHECK_FALSE(called);
    CHECK(h.out.str().find("Usage: demo [options...]\n\nCommands:\n  add (args: 2)\n") == 0);

    h.out.str("");
    REQUIRE(h.app.run({"-v"}).isOk());
    CHECK(called);
    CHECK(h.out.str().empty());
}

TEST_CASE("root usage falls back to argv[0], then to command") {
    std::ostringstream out;
    Options options;
    options.out = &out;
    App app(options);
    app.add("", [](const RootArgs&) {});

    REQUIRE(app.run(std::vector<std::string>{}).isOk());
    CHECK(out.str().find("Usage: command [options...]\n") == 0);

    out.str("");
    const char* argv[] = {"mytool", "--help"};
    REQUIRE(app.run(2, argv).isOk());
    CHECK(out.str().find("Usage: mytool [options...]\n") == 0);
    CHECK(app.program_name() == "mytool");
}

TEST_CASE("configured program_name wins over argv[0]") {
    Harness h;
    h.app.add("", [](const RootArgs&) {});

    const char* argv[] = {"/usr/bin/other"};
    REQUIRE(h.app.run(1, argv).isOk());
    CHECK(h.out.str().find("Usage: demo [options...]\n") == 0);
}

// ============================================================================
// Settings
// ============================================================================

TEST_CASE("settings file log_level takes effect when the App is built") {
    auto previous = spdlog::get_level();
    spdlog::set_level(spdlog::level::warn);

    auto parsed = parse_options(R"({"log_level": "error", "program_name": "tool"})");
    REQUIRE(parsed.ok);
    App configured(parsed.options);
    CHECK(spdlog::get_level() == spdlog::level::err);
    CHECK(configured.program_name() == "tool");

    SUBCASE("empty level leaves the current one") {
        App untouched{Options{}};
        CHECK(spdlog::get_level() == spdlog::level::err);
    }
    SUBCASE("unknown level is ignored") {
        Options options;
        options.log_level = "chatty";
        App ignored(options);
        CHECK(spdlog::get_level() == spdlog::level::err);
    }

    spdlog::set_level(previous);
}
