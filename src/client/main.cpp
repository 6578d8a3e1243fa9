#include <iostream>
#include <vector>
#include <string>
#include <cstdlib>
#include "platform.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

    void usage() {
        std::cerr << "Usage: verity [--socket <name>] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                  - Test connection\n";
        std::cerr << "  status                - Index and backend summary\n";
        std::cerr << "  health                - Probe generation backend and index\n";
        std::cerr << "  ask [-k N] <question> - Answer a question\n";
        std::cerr << "  stream [-k N] <question> - Answer a question, printing tokens as they arrive\n";
        std::cerr << "  ingest [keys...]      - Ingest all documents or the given keys\n";
        std::cerr << "  shutdown              - Stop the daemon\n";
    }

    json build_request(const std::string& command, const std::vector<std::string>& args) {
        json params = json::object();
        std::string method = command;

        if (command == "ask" || command == "stream") {
            method = command == "ask" ? "ask" : "ask_stream";
            std::string query;
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == "-k" && i + 1 < args.size()) {
                    params["top_k"] = std::atoll(args[++i].c_str());
                    continue;
                }
                if (!query.empty()) query += " ";
                query += args[i];
            }
            params["query"] = query;
        } else if (command == "ingest" && !args.empty()) {
            params["keys"] = args;
        }
        return {{"method", method}, {"params", params}};
    }

}

int main(int argc, char* argv[]) {
    std::string socket = "verity.sock";
    if (const char* env = std::getenv("VERITY_SOCKET")) socket = env;

    int first = 1;
    if (argc > 2 && std::string(argv[1]) == "--socket") {
        socket = argv[2];
        first = 3;
    }
    if (argc <= first) {
        usage();
        return 1;
    }

    std::string command = argv[first];
    std::vector<std::string> args;
    for (int i = first + 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    auto client = verity::platform::Client::create();
    if (!client->connect(socket)) {
        std::cerr << "Error: Could not connect to verityd daemon. Is it running?\n";
        return 1;
    }

    if (!client->send(build_request(command, args).dump())) {
        std::cerr << "Error: Failed to send request.\n";
        return 1;
    }

    int status = 0;
    std::string frame;
    while (client->read_frame(frame)) {
        json j = json::parse(frame, nullptr, false);
        if (j.is_discarded()) {
            std::cout << frame << "\n";
            continue;
        }
        if (j.contains("error")) {
            std::cerr << "Error (" << j.value("kind", "unknown") << "): " << j["error"].get<std::string>() << "\n";
            status = 1;
            continue;
        }
        std::string type = j.value("type", "");
        if (type == "metadata") {
            std::cerr << "[" << j.value("num_documents", 0) << " documents, query: "
                      << j.value("reformulated_query", "") << "]\n";
        } else if (type == "chunk") {
            std::cout << j.value("content", "") << std::flush;
        } else if (type == "end") {
            std::cout << "\n";
        } else if (command == "ask" && j.contains("result")) {
            std::cout << j["result"].value("answer", "") << "\n";
        } else {
            std::cout << j.dump(2) << "\n";
        }
    }

    return status;
}
