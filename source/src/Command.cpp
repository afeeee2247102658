#include "Command.hpp"

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) return {};

    auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

// splits off the first whitespace separated word, rest is trimmed
std::pair<std::string_view, std::string_view> split_word(std::string_view s) {
    s = trim(s);

    auto end = s.find_first_of(WHITESPACE);
    if (end == std::string_view::npos) return { s, {} };

    return { s.substr(0, end), trim(s.substr(end)) };
}

}

std::optional<Command> parse_command(std::string_view line) {
    auto [word, rest] = split_word(line);

    if (word == ":peers" && rest.empty()) return ShowPeers{};
    if (word == ":whoami" && rest.empty()) return ShowIdentity{};
    if (word == ":transfers" && rest.empty()) return ShowTransfers{};
    if (word == ":quit" && rest.empty()) return Quit{};

    if (word == ":hello") {
        auto [ip, extra] = split_word(rest);
        if (ip.empty() || !extra.empty()) return std::nullopt;
        return Probe{ std::string(ip) };
    }

    if (word == ":send") {
        auto [name, text] = split_word(rest);
        if (name.empty() || text.empty()) return std::nullopt;
        return SendChat{ std::string(name), std::string(text) };
    }

    // the path may contain spaces
    if (word == ":sendfile") {
        auto [name, path] = split_word(rest);
        if (name.empty() || path.empty()) return std::nullopt;
        return SendFile{ std::string(name), std::string(path) };
    }

    return std::nullopt;
}

std::string_view usage_for(std::string_view line) {
    auto word = split_word(line).first;

    if (word == ":hello") return "Invalid command. Usage: :hello ip";
    if (word == ":send") return "Invalid command. Usage: :send name message";
    if (word == ":sendfile") return "Invalid command. Usage: :sendfile name path";
    if (word == ":peers" || word == ":whoami" || word == ":transfers" || word == ":quit") return "Invalid command. This command takes no arguments";

    return {};
}
