#include "sgnet/Errors.hpp"

#include <cerrno>
#include <utility>

namespace sgnet {

ArgumentError::ArgumentError(std::string param_name, const std::string& message)
    : std::invalid_argument(message + " (parameter '" + param_name + "')"),
      param_name_(std::move(param_name)) {}

const std::string& ArgumentError::paramName() const noexcept {
    return param_name_;
}

ArgumentNullError::ArgumentNullError(std::string param_name)
    : ArgumentError(std::move(param_name), "value must not be null") {}

ArgumentOutOfRangeError::ArgumentOutOfRangeError(std::string param_name, const std::string& message)
    : ArgumentError(std::move(param_name), message) {}

ObjectDisposedError::ObjectDisposedError(std::string object_name)
    : std::logic_error("cannot access a disposed object: " + object_name),
      object_name_(std::move(object_name)) {}

const std::string& ObjectDisposedError::objectName() const noexcept {
    return object_name_;
}

FileNotFoundError::FileNotFoundError(std::string path)
    : std::system_error(ENOENT, std::generic_category(), "could not find file '" + path + "'"),
      path_(std::move(path)) {}

const std::string& FileNotFoundError::path() const noexcept {
    return path_;
}

DirectoryNotFoundError::DirectoryNotFoundError(std::string path)
    : std::system_error(ENOENT, std::generic_category(), "could not find a part of the path '" + path + "'"),
      path_(std::move(path)) {}

const std::string& DirectoryNotFoundError::path() const noexcept {
    return path_;
}

}  // namespace sgnet
