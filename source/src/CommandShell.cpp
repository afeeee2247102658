#include "CommandShell.hpp"
#include "Node.hpp"
#include "PeerSnapshot.hpp"
#include "TransferSnapshot.hpp"

#include <print>
#include <string>

void CommandShell::run(std::istream& in) {
    std::println("Ready. Commands: :peers :whoami :hello <ip> :send <name> <message> :sendfile <name> <path> :transfers :quit");

    std::string line;

    while (!_node.is_stopped() && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto cmd = parse_command(line);

        if (!cmd) {
            auto usage = usage_for(line);
            std::println("{}", usage.empty() ? "Unknown command." : usage);
            continue;
        }

        if (!execute(*cmd)) return;
    }
}

bool CommandShell::execute(const Command& cmd) {
    if (std::holds_alternative<ShowPeers>(cmd)) {
        show_peers();
    }
    else if (std::holds_alternative<ShowIdentity>(cmd)) {
        show_identity();
    }
    else if (std::holds_alternative<ShowTransfers>(cmd)) {
        show_transfers();
    }
    else if (auto* probe = std::get_if<Probe>(&cmd)) {
        auto result = _node.probe(probe->ip);
        std::println("{}", result.message);
    }
    else if (auto* chat = std::get_if<SendChat>(&cmd)) {
        auto result = _node.send_chat(chat->name, chat->text);
        if (!result.success) std::println("{}", result.message);
    }
    else if (auto* file = std::get_if<SendFile>(&cmd)) {
        auto result = _node.send_file(file->name, file->path);

        if (result.success) std::println("Sending {} to {} in {} chunks", result.file, result.peer, result.chunks);
        else std::println("Could not send {}: {}", result.file, result.error);
    }
    else if (std::holds_alternative<Quit>(cmd)) {
        return false;
    }

    return true;
}

void CommandShell::show_peers() const {
    auto peers = _node.peers();

    std::println("IP:\t\tName:\t\tLast seen:");
    for (const auto& p: peers) {
        std::println("{}\t{}\t\t{}s ago{}", p.ip, p.name, p.seconds_since_seen, p.listening ? "" : " (no listener)");
    }
}

void CommandShell::show_identity() const {
    const auto& id = _node.whoami();
    std::println("IP:{}\tName:{}", id.address.to_string(), id.name);
}

void CommandShell::show_transfers() const {
    auto live = _node.transfers();
    auto finished = _node.finished_transfers();

    if (live.empty() && finished.empty()) {
        std::println("No transfers.");
        return;
    }

    for (const auto& t: live) {
        auto arrow = t.direction == Direction::Outbound ? "->" : "<-";

        if (t.total_known) std::println("{} {} {}: {}/{} chunks, {} in flight, credit {}", arrow, t.peer, t.file, t.done, t.total, t.in_flight, t.credit);
        else std::println("{} {} {}: {}/? chunks, credit {}", arrow, t.peer, t.file, t.done, t.credit);
    }

    for (const auto& r: finished) {
        auto arrow = r.direction == Direction::Outbound ? "->" : "<-";

        if (r.success) std::println("{} {} {}: done, {} chunks{}", arrow, r.peer, r.file, r.chunks, r.path.empty() ? "" : ", saved to " + r.path.string());
        else std::println("{} {} {}: failed, {}", arrow, r.peer, r.file, r.error);
    }
}
