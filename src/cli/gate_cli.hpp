#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_tool_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);

class GateCLI : public BaseCLI {
public:
    explicit GateCLI(Config config);

    void run_repl();

private:
    void register_all_commands();
};
