#include "Command.hpp"

#include <cassert>

int main() {
    assert(std::holds_alternative<ShowPeers>(*parse_command(":peers")));
    assert(std::holds_alternative<ShowIdentity>(*parse_command("  :whoami  ")));
    assert(std::holds_alternative<ShowTransfers>(*parse_command(":transfers")));
    assert(std::holds_alternative<Quit>(*parse_command(":quit\r")));

    auto probe = parse_command(":hello 192.168.1.20");
    assert(probe && std::get<Probe>(*probe).ip == "192.168.1.20");

    // the rest of the line is the message, inner spacing kept
    auto chat = parse_command(":send bob  hello   there  ");
    assert(chat);
    assert(std::get<SendChat>(*chat).name == "bob");
    assert(std::get<SendChat>(*chat).text == "hello   there");

    auto file = parse_command(":sendfile bob /tmp/my file.txt");
    assert(file);
    assert(std::get<SendFile>(*file).name == "bob");
    assert(std::get<SendFile>(*file).path == "/tmp/my file.txt");

    assert(!parse_command(""));
    assert(!parse_command("hello"));
    assert(!parse_command(":hello"));
    assert(!parse_command(":hello 1.2.3.4 extra"));
    assert(!parse_command(":send bob"));
    assert(!parse_command(":sendfile"));
    assert(!parse_command(":peers now"));
    assert(!parse_command(":sender bob hi"));

    assert(usage_for(":send bob") == "Invalid command. Usage: :send name message");
    assert(usage_for(":hello") == "Invalid command. Usage: :hello ip");
    assert(usage_for(":dance").empty());

    return 0;
}
