#pragma once

#include <stdexcept>
#include <string>


namespace nbns 
{

// Base of every failure raised while building or reading a NetBIOS name.
class NameError : public std::runtime_error
{
public:
    explicit NameError(const std::string& what) : std::runtime_error(what) {}
};

// Name text does not fit in the 15 bytes left before the purpose byte.
class NameTooLongError : public NameError
{
public:
    explicit NameTooLongError(const std::string& what) : NameError(what) {}
};

// Scope label empty or longer than 63 bytes, or encoded name longer than 255 bytes.
class InvalidScopeError : public NameError
{
public:
    explicit InvalidScopeError(const std::string& what) : NameError(what) {}
};

// Received bytes are not a first-level encoded name.
class MalformedNameError : public NameError
{
public:
    explicit MalformedNameError(const std::string& what) : NameError(what) {}
};

// Fewer than 12 bytes where an NBNS header was expected.
class MalformedHeaderError : public std::runtime_error
{
public:
    explicit MalformedHeaderError(const std::string& what) : std::runtime_error(what) {}
};

}
