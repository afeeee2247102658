#include "Node.hpp"
#include "CommandShell.hpp"

#include <iostream>
#include <print>
#include <charconv>

// peerlink [name] [port] [download-dir]
int main(int argc, char** argv) {
    try {
        NodeConfig config;

        if (argc > 1) config.name = argv[1];

        if (argc > 2) {
            std::string_view arg = argv[2];
            uint16_t port{};

            auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), port);
            if (ec != std::errc{} || ptr != arg.data() + arg.size() || port == 0) throw std::runtime_error("Invalid port: " + std::string(arg));

            config.port = port;
        }

        if (argc > 3) config.download_dir = argv[3];

        if (argc > 4) throw std::runtime_error("Usage: peerlink [name] [port] [download-dir]");

        Node node(std::move(config));
        node.start();

        CommandShell shell(node);
        shell.run(std::cin);

        node.stop();
        node.wait();
    }

    catch (const std::exception& ex) {
        std::println("{}", ex.what());
        return 1;
    }
}
