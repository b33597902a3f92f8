#include "commands.hpp"
#include "config.hpp"
#include "jsonl_transport.hpp"
#include "run_relay.hpp"
#include "session_store.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <nlohmann/json.hpp>

static void print_usage() {
    std::cout << "Usage: runbus [options]\n"
              << "\n"
              << "Reads JSON commands from stdin, one per line, and writes every\n"
              << "transport delivery to stdout as one JSON line.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.runbus/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  {\"op\":\"emit\",\"runId\":R,\"stream\":S,\"data\":{...},\"sessionKey\":K}\n"
              << "  {\"op\":\"register\",\"runId\":R,\"sessionKey\":K,\"verboseLevel\":V,\"isHeartbeat\":B}\n"
              << "  {\"op\":\"chat\",\"runId\":R,\"sessionKey\":K,\"clientRunId\":C}\n"
              << "  {\"op\":\"abort\",\"runId\":R,\"clientRunId\":C}\n"
              << "  {\"op\":\"tools\",\"runId\":R,\"connId\":ID}\n"
              << "  {\"op\":\"session\",\"sessionKey\":K,\"verboseLevel\":V}\n"
              << "\n"
              << "Environment variables:\n"
              << "  RUNBUS_VERBOSE_DEFAULT     Agent-default tool verbosity (off|partial|full)\n"
              << "  RUNBUS_HEARTBEAT_SHOW_OK   Broadcast quiet heartbeat runs (true|false)\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty()
        ? runbus::Config::load()
        : runbus::Config::load_from(config_path);

    runbus::JsonLinesTransport transport(std::cout);
    runbus::InMemorySessionStore sessions;
    runbus::RunRelay relay(transport, config, &sessions);

    std::string line;
    size_t line_no = 0;
    while (std::getline(std::cin, line)) {
        line_no++;
        if (runbus::trim(line).empty()) continue;

        nlohmann::json cmd;
        try {
            cmd = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[runbus] line " << line_no << ": " << e.what() << "\n";
            continue;
        }

        auto err = runbus::apply_command(cmd, relay, sessions);
        if (!err.empty()) {
            std::cerr << "[runbus] line " << line_no << ": " << err << "\n";
        }
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
