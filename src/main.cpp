#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "gateway.hpp"

static void print_usage() {
    std::cout << "Usage: switchboard <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Write default config and server list\n"
              << "  status                      Show current configuration\n"
              << "  gateway [--host H] [--port P]\n"
              << "                              Start the HTTP gateway\n"
              << "  servers                     Connect configured MCP servers and describe them\n"
              << "  discover                    Probe the discovery port range\n"
              << "  digest [--context C]... [--limit N]\n"
              << "                              Print the capability digest\n"
              << "  call TOOL [JSON_ARGS]       Call one tool directly\n"
              << "  chat -m MSG [--session S] [--model M] [--context C]...\n"
              << "                              Run one turn against the model\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "init") {
        return switchboard::cmd_init();
    }
    else if (cmd == "status") {
        return switchboard::cmd_status();
    }
    else if (cmd == "gateway") {
        std::string host;
        int port = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                port = std::stoi(args[++i]);
            }
        }
        return switchboard::cmd_gateway(host, port);
    }
    else if (cmd == "servers") {
        return switchboard::cmd_servers();
    }
    else if (cmd == "discover") {
        return switchboard::cmd_discover();
    }
    else if (cmd == "digest") {
        std::vector<std::string> contexts;
        size_t limit = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--context" && i + 1 < args.size()) {
                contexts.push_back(args[++i]);
            } else if (args[i] == "--limit" && i + 1 < args.size()) {
                limit = static_cast<size_t>(std::stoul(args[++i]));
            }
        }
        return switchboard::cmd_digest(contexts, limit);
    }
    else if (cmd == "call") {
        if (args.empty()) {
            print_usage();
            return 1;
        }
        return switchboard::cmd_call(args[0], args.size() > 1 ? args[1] : "");
    }
    else if (cmd == "chat") {
        std::string message, session, model;
        std::vector<std::string> contexts;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                message = args[++i];
            } else if (args[i] == "--session" && i + 1 < args.size()) {
                session = args[++i];
            } else if (args[i] == "--model" && i + 1 < args.size()) {
                model = args[++i];
            } else if (args[i] == "--context" && i + 1 < args.size()) {
                contexts.push_back(args[++i]);
            }
        }
        return switchboard::cmd_chat(message, session, model, contexts);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
