// actionstream_sh: runs one command per input line in a local shell session.
//
//   actionstream_sh [--shell PATH] [--timeout SECONDS] [--sanitize] [--cwd DIR]
//
// Lines starting with ':' are session commands (:abort, :state, :quit).

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "../include/config.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.h"
#include "../include/posix_shell_channel.hpp"
#include "../include/shell_session.hpp"

using namespace actionstream::core;

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--shell PATH] [--timeout SECONDS] [--sanitize] [--cwd DIR]\n";
}

bool parse_args(int argc, char** argv, Config& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string v;
        if (a == "--shell") {
            if (!next(cfg.shellPath)) return false;
        } else if (a == "--cwd") {
            if (!next(cfg.workingDirectory)) return false;
        } else if (a == "--timeout") {
            if (!next(v)) return false;
            char* end = nullptr;
            cfg.timeoutSeconds = std::strtod(v.c_str(), &end);
            if (end == v.c_str() || *end != '\0' || cfg.timeoutSeconds < 0) return false;
        } else if (a == "--sanitize") {
            cfg.sanitizeOutput = true;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Config cfg;
    if (!parse_args(argc, argv, cfg)) {
        usage(argv[0]);
        return 2;
    }

    auto session = std::make_shared<ShellSession>("cli", std::make_shared<PosixShellChannel>(cfg), cfg);
    session->setOutputListener([](std::string_view inc, bool reset) {
        if (reset) std::cout << "\n--- output reset ---\n";
        std::cout << inc << std::flush;
    });

    if (!session->start()) {
        std::cerr << "failed to start " << cfg.shellPath << "\n";
        return 1;
    }
    ASTREAM_DBG("SESSION", "cli session started shell=%s", cfg.shellPath.c_str());

    std::string line;
    while (std::cout << "$ " << std::flush, std::getline(std::cin, line)) {
        _ActionStreamHelpers::trim_inplace(line);
        if (line.empty()) continue;
        if (line == ":quit") break;
        if (line == ":state") {
            std::cout << to_string(session->state()) << " gen=" << session->generation() << "\n";
            continue;
        }
        if (line == ":abort") {
            std::cout << (session->abort() ? "aborted\n" : "nothing running\n");
            continue;
        }

        CommandResult r = session->executeCommand(line, [] { std::cerr << "[aborted]\n"; });
        if (!r.output.empty() && r.output.back() != '\n') std::cout << "\n";
        std::cout << "[" << to_string(r.status);
        if (r.exitCode != kExitCodeUnknown) std::cout << " exit=" << r.exitCode;
        std::cout << " " << r.executionTime << "s]\n";
    }

    session->stop();
    return 0;
}
