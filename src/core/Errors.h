#pragma once
#include <stdexcept>
#include <string>

namespace rack_scan {

// Subnet descriptor could not be parsed.
class InvalidSubnetError : public std::runtime_error {
public:
    explicit InvalidSubnetError(const std::string& msg) : std::runtime_error(msg) {}
};

// Well-formed subnet that holds more candidates than the enumeration limit.
class SubnetTooLargeError : public std::runtime_error {
public:
    explicit SubnetTooLargeError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Fatal-to-run failure; what() matches the scan record's error_message.
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& msg) : std::runtime_error(msg) {}
};

}
