#include <iostream>
#include <string>
#include <vector>
#include <sstream>
#include <filesystem>
#include "core/ConfigManager.h"
#include "core/MCPHost.h"
#include "mcp/ProcessLauncher.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

void printUsage() {
    std::cout << BOLD << "Usage:" << RESET << " mcphost [config.json]" << std::endl;
    std::cout << GRAY << "  Without an argument, config.json is looked up in ., .. and next to the executable." << RESET << std::endl;
}

void printHelp() {
    std::cout << CYAN << "Commands:" << RESET << std::endl;
    std::cout << "  servers                              list connected servers" << std::endl;
    std::cout << "  tools                                list all tools (<server>__<tool>)" << std::endl;
    std::cout << "  call <server> <tool> [json-args]     invoke a tool" << std::endl;
    std::cout << "  connect <name> <command> [args...]   start and register a server" << std::endl;
    std::cout << "  disconnect <name>                    stop a server" << std::endl;
    std::cout << "  which <command>                      check a command is resolvable" << std::endl;
    std::cout << "  help | quit" << std::endl;
}

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> out;
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

void printReply(const nlohmann::json& reply) {
    if (reply.is_object() && reply.contains("error")) {
        std::cout << RED << "✖ " << reply["error"].get<std::string>() << RESET << std::endl;
        return;
    }
    std::cout << reply.dump(2) << std::endl;
}

std::string locateConfig(int argc, char* argv[]) {
    if (argc >= 2) return argv[1];
    if (fs::exists(fs::u8path("config.json"))) return "config.json";
    if (fs::exists(fs::u8path("../config.json"))) return "../config.json";

    std::error_code ec;
    fs::path exeDir = fs::canonical("/proc/self/exe", ec).parent_path();
    if (!ec && fs::exists(exeDir / "config.json")) {
        return (exeDir / "config.json").u8string();
    }
    return "config.json";
}

void runCommandLoop(MCPHost& host) {
    std::string line;
    while (true) {
        std::cout << BOLD << "mcp> " << RESET << std::flush;
        if (!std::getline(std::cin, line)) break;

        auto words = splitWords(line);
        if (words.empty()) continue;
        const std::string& cmd = words[0];

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            printHelp();
        } else if (cmd == "servers") {
            printReply(host.listConnectedServers());
        } else if (cmd == "tools") {
            printReply(host.listTools());
        } else if (cmd == "call" && words.size() >= 3) {
            // Arguments are the raw remainder of the line after "<server> <tool>"
            nlohmann::json args = nlohmann::json::object();
            std::istringstream iss(line);
            std::string skip;
            iss >> skip >> skip >> skip;
            std::string rest;
            std::getline(iss, rest);
            if (rest.find_first_not_of(" \t") != std::string::npos) {
                try {
                    args = nlohmann::json::parse(rest);
                } catch (const nlohmann::json::parse_error& e) {
                    std::cout << RED << "✖ Invalid JSON arguments: " << e.what() << RESET << std::endl;
                    continue;
                }
            }
            printReply(host.callTool(words[1], words[2], args));
        } else if (cmd == "connect" && words.size() >= 3) {
            std::vector<std::string> args(words.begin() + 3, words.end());
            printReply(host.connect(words[1], words[2], args, {}));
        } else if (cmd == "disconnect" && words.size() == 2) {
            printReply(host.disconnect(words[1]));
        } else if (cmd == "which" && words.size() == 2) {
            printReply(host.checkCommandExists(words[1]));
        } else {
            std::cout << RED << "✖ Unknown command: " << line << RESET << std::endl;
            printHelp();
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage();
        return 0;
    }

    std::string configPath = locateConfig(argc, argv);
    Config cfg;
    try {
        if (!fs::exists(fs::u8path(configPath))) {
            throw std::runtime_error("Configuration file not found: " + configPath);
        }
        cfg = Config::load(configPath);
        std::cout << GREEN << "✔ Loaded configuration from: " << BOLD << configPath << RESET << std::endl;
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }

    auto& log = Logger::getInstance();
    log.setLogFile(cfg.logging.file);
    log.setDebugEnabled(cfg.logging.debug);
    log.setConsoleEnabled(cfg.logging.console);

    PosixProcessLauncher launcher;
    MCPHost host(launcher, cfg.mcp);

    int connected = host.connectAll(cfg.mcpServers);
    log.info("Connected " + std::to_string(connected) + " MCP server(s)");

    printHelp();
    runCommandLoop(host);

    host.manager().shutdownAll();
    return 0;
}
