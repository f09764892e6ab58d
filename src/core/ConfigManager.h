#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct MCP {
        int requestTimeoutMs = 30000;
        int shutdownGraceMs = 500;
        size_t maxLineBytes = 16 * 1024 * 1024;
        std::string clientName = "mcphost";
        std::string clientVersion = "0.1.0";
    } mcp;

    struct Logging {
        std::string file = "mcphost.log";
        bool debug = false;
        bool console = true;
    } logging;

    struct MCPServerConfig {
        std::string name;
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        bool enabled = true;
    };
    std::vector<MCPServerConfig> mcpServers;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("mcp")) {
            const auto& m = j.at("mcp");
            cfg.mcp.requestTimeoutMs = m.value("request_timeout_ms", cfg.mcp.requestTimeoutMs);
            cfg.mcp.shutdownGraceMs = m.value("shutdown_grace_ms", cfg.mcp.shutdownGraceMs);
            cfg.mcp.maxLineBytes = m.value("max_line_bytes", cfg.mcp.maxLineBytes);
            cfg.mcp.clientName = m.value("client_name", cfg.mcp.clientName);
            cfg.mcp.clientVersion = m.value("client_version", cfg.mcp.clientVersion);
        }
        if (cfg.mcp.requestTimeoutMs <= 0) {
            throw std::runtime_error("mcp.request_timeout_ms must be positive");
        }

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            cfg.logging.file = l.value("file", cfg.logging.file);
            cfg.logging.debug = l.value("debug", cfg.logging.debug);
            cfg.logging.console = l.value("console", cfg.logging.console);
        }

        if (j.contains("mcp_servers")) {
            for (const auto& item : j["mcp_servers"]) {
                MCPServerConfig server;
                server.name = item.at("name").get<std::string>();
                server.command = item.at("command").get<std::string>();
                server.args = item.value("args", std::vector<std::string>{});
                server.env = item.value("env", std::map<std::string, std::string>{});
                server.enabled = item.value("enabled", true);
                if (server.name.empty() || server.command.empty()) {
                    throw std::runtime_error("mcp_servers entries need a name and a command");
                }
                cfg.mcpServers.push_back(std::move(server));
            }
        }
        return cfg;
    }
};
