#pragma once

#include <stdexcept>
#include <string>

namespace resident {

class registry_error : public std::runtime_error {
public:
    explicit registry_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Registration attempted while no live object scope is open
class no_open_scope_error : public registry_error {
public:
    explicit no_open_scope_error(const std::string& msg) : registry_error(msg) {}
};

/// Object already has a record, or its id is taken by another live object
class already_registered_error : public registry_error {
public:
    explicit already_registered_error(const std::string& msg) : registry_error(msg) {}
};

class invalid_argument_error : public registry_error {
public:
    explicit invalid_argument_error(const std::string& msg) : registry_error(msg) {}
};

class config_error : public registry_error {
public:
    explicit config_error(const std::string& msg) : registry_error(msg) {}
};

} // namespace resident
