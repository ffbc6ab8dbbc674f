#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace sgnet {

// Local, synchronous error channel. Everything here is thrown before any byte
// reaches the transport; transmission-time failures are reported through
// net::SocketError statuses instead.

// Invalid argument value. Carries the name of the offending parameter.
class ArgumentError : public std::invalid_argument {
public:
    ArgumentError(std::string param_name, const std::string& message);

    const std::string& paramName() const noexcept;

private:
    std::string param_name_;
};

class ArgumentNullError : public ArgumentError {
public:
    explicit ArgumentNullError(std::string param_name);
};

class ArgumentOutOfRangeError : public ArgumentError {
public:
    ArgumentOutOfRangeError(std::string param_name, const std::string& message);
};

// Call is not valid for the object's current state.
class InvalidOperationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class ObjectDisposedError : public std::logic_error {
public:
    explicit ObjectDisposedError(std::string object_name);

    const std::string& objectName() const noexcept;

private:
    std::string object_name_;
};

class FileNotFoundError : public std::system_error {
public:
    explicit FileNotFoundError(std::string path);

    const std::string& path() const noexcept;

private:
    std::string path_;
};

class DirectoryNotFoundError : public std::system_error {
public:
    explicit DirectoryNotFoundError(std::string path);

    const std::string& path() const noexcept;

private:
    std::string path_;
};

}  // namespace sgnet
