/**
 * octpkg CLI - test command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const TestCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    auto result = pm->test(cmd.names);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    bool all_passed = true;
    for (const auto& r : result.value()) {
        if (!r.passed) all_passed = false;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_passed;
        j["results"] = nlohmann::json::array();
        for (const auto& r : result.value()) {
            j["results"].push_back({{"name", r.name}, {"passed", r.passed}, {"detail", r.detail}});
        }
        output_json(j);
    } else {
        for (const auto& r : result.value()) {
            std::cout << r.name << ": " << (r.passed ? "PASS" : "FAIL");
            if (!r.detail.empty()) std::cout << " (" << r.detail << ")";
            std::cout << std::endl;
        }
    }

    return all_passed ? 0 : 1;
}

namespace commands {

void setup_test(CLI::App* app, Command& selected) {
    static TestCommand test_cmd;

    app->add_option("names", test_cmd.names, "Packages to test")->required();

    app->callback([&selected]() {
        selected = test_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
