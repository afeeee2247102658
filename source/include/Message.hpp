#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <string_view>

// one enumeration for every kind on the wire, membership and chat kinds keep
// their textual tags, file kinds keep their numeric tags
enum class MessageType: uint8_t {
    Hello = 1,
    HelloAck,
    Chat,
    FileChunk,
    FileAck
};

struct Hello {
    std::string name;
};

struct HelloAck {
    std::string name;
};

struct Chat {
    std::string text;
};

// seq 0 is the control chunk, it carries the chunk count instead of a payload
struct FileChunk {
    std::string file_id;
    uint32_t seq{};
    std::vector<unsigned char> payload;
    uint32_t total{};

    bool is_control() const { return seq == 0; }
};

struct FileAck {
    std::string file_id;
    uint32_t seq{};
    uint32_t credit{};
};

using Message = std::variant<Hello, HelloAck, Chat, FileChunk, FileAck>;

MessageType type_of(const Message& msg);
std::string_view to_string(MessageType type);

std::string encode(const Message& msg);

// throws MalformedMessage
Message decode(std::string_view bytes);
