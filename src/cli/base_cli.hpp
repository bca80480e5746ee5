#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <gateway/command_gateway.hpp>
#include "result_view.hpp"

class BaseCLI {
public:
    explicit BaseCLI(Config config);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Run one line inside the session and print its result.
    void run_in_session(ToolCategory category, const std::string& command);

    // Public state
    Config config;
    std::unique_ptr<CommandGateway> gateway;
    std::unique_ptr<Session> session;
    OutputFormat format = OutputFormat::Text;
    int last_exit_code = 0;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
