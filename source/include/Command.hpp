#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

struct ShowPeers {};
struct ShowIdentity {};
struct ShowTransfers {};
struct Quit {};

struct Probe {
    std::string ip;
};

struct SendChat {
    std::string name, text;
};

struct SendFile {
    std::string name, path;
};

using Command = std::variant<ShowPeers, ShowIdentity, Probe, SendChat, SendFile, ShowTransfers, Quit>;

// nullopt for anything that is not a well formed command
std::optional<Command> parse_command(std::string_view line);

// usage line for a command word, empty when the word is unknown
std::string_view usage_for(std::string_view line);
