#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: toolguard [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  check --tool NAME [--input JSON]\n"
              << "                              Dry-run the security rules against a tool call\n"
              << "  rules [--all]               List security rules (--all includes disabled)\n"
              << "  hooks                       List registered hooks and counts\n"
              << "  pre-action                  Dispatch a pre-action event read from stdin\n"
              << "  post-action                 Dispatch a post-action event read from stdin\n"
              << "  prompt                      Dispatch a prompt-submitted event read from stdin\n"
              << "  stop                        Dispatch a stop event read from stdin\n\n"
              << "Exit status 2 means the action was blocked.\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = toolguard::default_config_path();
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = toolguard::expand_path(argv[++i]);
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = args[0];
    args.erase(args.begin());

    if (cmd == "check") {
        std::string tool;
        std::string input;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--tool" && i + 1 < args.size()) {
                tool = args[++i];
            } else if (args[i] == "--input" && i + 1 < args.size()) {
                input = args[++i];
            }
        }
        return toolguard::cmd_check(config_path, tool, input);
    }
    else if (cmd == "rules") {
        bool all = false;
        for (auto& a : args) {
            if (a == "--all") all = true;
        }
        return toolguard::cmd_rules(config_path, all);
    }
    else if (cmd == "hooks") {
        return toolguard::cmd_hooks(config_path);
    }
    else if (cmd == "pre-action") {
        return toolguard::cmd_event(config_path, toolguard::HookType::pre_action);
    }
    else if (cmd == "post-action") {
        return toolguard::cmd_event(config_path, toolguard::HookType::post_action);
    }
    else if (cmd == "prompt") {
        return toolguard::cmd_event(config_path, toolguard::HookType::prompt_submitted);
    }
    else if (cmd == "stop") {
        return toolguard::cmd_event(config_path, toolguard::HookType::stop);
    }
    else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
