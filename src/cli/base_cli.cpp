#include "base_cli.hpp"
#include "theme.hpp"
#include <platform/platform.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(Config cfg) : config(std::move(cfg)) {
    gateway = std::make_unique<CommandGateway>(config.policy());
    session = std::make_unique<Session>(*gateway);
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::run_in_session(ToolCategory category, const std::string& command) {
    auto result = session->run(category, command);
    last_exit_code = exit_status_for(result);
    print_result(result, format);
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Tools",   {"npm", "python", "terraform", "git", "run"}},
        {"Session", {"cd", "pwd", "check", "format"}},
        {"Policy",  {"policy"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string dir = session->cwd().filename().string();
    if (dir.empty()) dir = session->cwd().string();

    std::string mark = last_exit_code == 0
        ? rl_esc(theme::color::GREEN) + ">" + rl_esc(theme::color::RESET)
        : rl_esc(theme::color::RED) + ">" + rl_esc(theme::color::RESET);

    return rl_esc(theme::color::TEAL) + "cmdgate"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::SAND) + dir
         + rl_esc(theme::color::RESET) + mark + " ";
}
