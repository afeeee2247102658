#include "Message.hpp"
#include "Errors.hpp"

#include <limits>

#include <boost/json.hpp>
#include <boost/beast/core/detail/base64.hpp>

namespace json = boost::json;
namespace base64 = boost::beast::detail::base64;

namespace {

// wire tags, the textual ones are what existing chat nodes on the LAN send
constexpr std::string_view HELLO_TAG = "hello";
constexpr std::string_view HELLO_ACK_TAG = "aleykumselam";
constexpr std::string_view CHAT_TAG = "message";

std::string encode_base64(const std::vector<unsigned char>& bytes) {
    std::string out(base64::encoded_size(bytes.size()), '\0');
    out.resize(base64::encode(out.data(), bytes.data(), bytes.size()));
    return out;
}

std::vector<unsigned char> decode_base64(std::string_view text) {
    if (text.size() % 4 != 0) throw MalformedMessage("invalid base64 body");

    // the decoder stops at padding, anything it leaves unread besides padding is garbage
    auto body = text;
    for (int i = 0; i < 2 && body.ends_with('='); ++i) body.remove_suffix(1);

    std::vector<unsigned char> out(base64::decoded_size(text.size()));
    auto [written, consumed] = base64::decode(out.data(), body.data(), body.size());

    if (consumed != body.size()) throw MalformedMessage("invalid base64 body");

    out.resize(written);
    return out;
}

MessageType parse_type(const json::value& tag) {
    if (tag.is_string()) {
        std::string_view s = tag.as_string();
        if (s == HELLO_TAG) return MessageType::Hello;
        if (s == HELLO_ACK_TAG) return MessageType::HelloAck;
        if (s == CHAT_TAG) return MessageType::Chat;
        throw MalformedMessage("unknown type tag '" + std::string(s) + "'");
    }

    if (tag.is_int64() || tag.is_uint64()) {
        auto n = tag.is_int64() ? tag.as_int64() : static_cast<int64_t>(tag.as_uint64());
        if (n == static_cast<int64_t>(MessageType::FileChunk)) return MessageType::FileChunk;
        if (n == static_cast<int64_t>(MessageType::FileAck)) return MessageType::FileAck;
        throw MalformedMessage("unknown type tag " + std::to_string(n));
    }

    throw MalformedMessage("type tag is neither a string nor an integer");
}

const json::value& require(const json::object& obj, std::string_view key) {
    auto* v = obj.if_contains(key);
    if (!v) throw MalformedMessage("missing field '" + std::string(key) + "'");
    return *v;
}

std::string require_string(const json::object& obj, std::string_view key) {
    const auto& v = require(obj, key);
    if (!v.is_string()) throw MalformedMessage("field '" + std::string(key) + "' is not a string");
    return std::string(v.as_string());
}

uint32_t require_u32(const json::object& obj, std::string_view key) {
    const auto& v = require(obj, key);

    if (v.is_uint64()) {
        if (v.as_uint64() > std::numeric_limits<uint32_t>::max()) throw MalformedMessage("field '" + std::string(key) + "' out of range");
        return static_cast<uint32_t>(v.as_uint64());
    }

    if (v.is_int64()) {
        auto n = v.as_int64();
        if (n < 0 || n > std::numeric_limits<uint32_t>::max()) throw MalformedMessage("field '" + std::string(key) + "' out of range");
        return static_cast<uint32_t>(n);
    }

    throw MalformedMessage("field '" + std::string(key) + "' is not an integer");
}

json::object encode_object(const Hello& m) {
    return { {"type", HELLO_TAG}, {"myname", m.name} };
}

json::object encode_object(const HelloAck& m) {
    return { {"type", HELLO_ACK_TAG}, {"myname", m.name} };
}

json::object encode_object(const Chat& m) {
    return { {"type", CHAT_TAG}, {"content", m.text} };
}

json::object encode_object(const FileChunk& m) {
    json::object obj;
    obj["type"] = static_cast<int>(MessageType::FileChunk);
    obj["name"] = m.file_id;
    obj["seq"] = m.seq;

    if (m.is_control()) obj["body"] = m.total;
    else obj["body"] = encode_base64(m.payload);

    return obj;
}

json::object encode_object(const FileAck& m) {
    json::object obj;
    obj["type"] = static_cast<int>(MessageType::FileAck);
    obj["name"] = m.file_id;
    obj["seq"] = m.seq;
    obj["rwnd"] = m.credit;
    return obj;
}

FileChunk decode_chunk(const json::object& obj) {
    FileChunk chunk;
    chunk.file_id = require_string(obj, "name");
    chunk.seq = require_u32(obj, "seq");

    if (chunk.is_control()) {
        chunk.total = require_u32(obj, "body");
    }
    else {
        const auto& body = require(obj, "body");
        if (!body.is_string()) throw MalformedMessage("chunk body is not a string");
        chunk.payload = decode_base64(body.as_string());
    }

    if (chunk.file_id.empty()) throw MalformedMessage("empty file name");
    return chunk;
}

}

MessageType type_of(const Message& msg) {
    return static_cast<MessageType>(msg.index() + 1);
}

std::string_view to_string(MessageType type) {
    switch (type) {
        case MessageType::Hello: return "Hello";
        case MessageType::HelloAck: return "HelloAck";
        case MessageType::Chat: return "Chat";
        case MessageType::FileChunk: return "FileChunk";
        case MessageType::FileAck: return "FileAck";
    }
    return "Unknown";
}

std::string encode(const Message& msg) {
    auto obj = std::visit([](const auto& m) { return encode_object(m); }, msg);
    return json::serialize(obj);
}

Message decode(std::string_view bytes) {
    boost::system::error_code ec;
    auto root = json::parse(bytes, ec);

    if (ec) throw MalformedMessage(ec.message());
    if (!root.is_object()) throw MalformedMessage("top level is not an object");

    const auto& obj = root.as_object();

    switch (parse_type(require(obj, "type"))) {
        case MessageType::Hello:
            return Hello{ require_string(obj, "myname") };

        case MessageType::HelloAck:
            return HelloAck{ require_string(obj, "myname") };

        case MessageType::Chat:
            return Chat{ require_string(obj, "content") };

        case MessageType::FileChunk:
            return decode_chunk(obj);

        case MessageType::FileAck: {
            FileAck ack{ require_string(obj, "name"), require_u32(obj, "seq"), require_u32(obj, "rwnd") };
            if (ack.file_id.empty()) throw MalformedMessage("empty file name");
            return ack;
        }
    }

    throw MalformedMessage("unhandled type");
}
