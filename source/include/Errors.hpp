#pragma once

#include <stdexcept>
#include <string>

// decode failure, the listener logs it and moves on
class MalformedMessage : public std::runtime_error {
public:
    explicit MalformedMessage(const std::string& what): std::runtime_error("Malformed message: " + what) {}
};

class FileNotFound : public std::runtime_error {
public:
    explicit FileNotFound(const std::string& path): std::runtime_error("File not found: " + path) {}
};

class FileUnreadable : public std::runtime_error {
public:
    explicit FileUnreadable(const std::string& path): std::runtime_error("File unreadable: " + path) {}
};
