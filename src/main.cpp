#include <iostream>
#include <string>
#include <core/config.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static void print_usage() {
    std::cout << "pipewatch - watch CI pipelines and runs\n\n"
              << "Usage\n"
              << "    pipewatch init              Write default settings to "
              << get_settings_path().string() << "\n"
              << "    pipewatch validate [path]   Check a settings file\n"
              << "\n"
              << "    pipewatch --version         Show version\n"
              << "    pipewatch --help            Show this help\n\n";
}

static int run_init() {
    bool existed = settings_exist();
    auto r = create_default_settings_file();
    if (r.is_err()) {
        std::cerr << "error: " << r.error << "\n";
        return 1;
    }
    std::cout << (existed ? "Settings already exist at " : "Wrote default settings to ")
              << get_settings_path().string() << "\n";
    return 0;
}

static int run_validate(const std::string& path_arg) {
    fs::path path = path_arg.empty() ? get_settings_path() : fs::path(path_arg);

    auto loaded = load_settings(path);
    if (loaded.is_err()) {
        std::cerr << "error: " << loaded.error << "\n";
        return 1;
    }

    auto report = validate_settings(loaded.value);
    for (const auto& e : report.errors) {
        std::cout << fmt::format("  error    {:<26} {}\n", e.field, e.message);
    }
    for (const auto& w : report.warnings) {
        std::cout << fmt::format("  warning  {:<26} {}\n", w.field, w.message);
    }

    if (!report.valid) {
        std::cout << path.string() << ": invalid\n";
        log_warn("cli: settings invalid: " + path.string());
        return 1;
    }
    std::cout << path.string() << ": ok\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << "pipewatch version 0.1.0\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            return run_init();
        } else if (cmd == "validate") {
            return run_validate(argc >= 3 ? argv[2] : "");
        }

        std::cerr << "Unknown command: " << cmd << "\n\n";
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
