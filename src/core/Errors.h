#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace pattern_harness {

// Registration of a name that is already present. The registry is left unchanged.
class DuplicateNameError : public std::runtime_error {
public:
    explicit DuplicateNameError(const std::string& name)
        : std::runtime_error("duplicate example name: " + name), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& name)
        : std::runtime_error("no such example: " + name), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

// Thrown by Example::setup() when a collaborator cannot be constructed.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& msg) : std::runtime_error(msg) {}
};

// run() output diverged from the declared expected outcome. line is 1-based.
class FailureMismatch : public std::runtime_error {
public:
    FailureMismatch(std::size_t line, const std::string& expected, const std::string& actual)
        : std::runtime_error("output mismatch at line " + std::to_string(line) + ": expected " + expected + ", got " + actual),
          line_(line), expected_(expected), actual_(actual) {}
    std::size_t line() const { return line_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }
private:
    std::size_t line_;
    std::string expected_;
    std::string actual_;
};

}
