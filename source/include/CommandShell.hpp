#pragma once

#include "Command.hpp"

#include <istream>

class Node;

// line oriented front end, reads commands until :quit or end of input
class CommandShell {
public:
    explicit CommandShell(Node& node): _node(node) {}

    void run(std::istream& in);

    // false once the shell should exit
    bool execute(const Command& cmd);

private:
    void show_peers() const;
    void show_identity() const;
    void show_transfers() const;

    Node& _node;
};
