#pragma once

#include <stdexcept>
#include <string>

// ----------------------------------------------------------
// Fehlerklassen für die beiden Kollaborateure
// ----------------------------------------------------------

// Collaborator (spacenavd, fixture) could not be reached.
class ConnectionError : public std::runtime_error
{
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

// Fixture did not answer before the connect deadline.
class ConnectTimeout : public ConnectionError
{
public:
    explicit ConnectTimeout(const std::string& what) : ConnectionError(what) {}
};

// I/O failure on an already established link.
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// "<context>: <strerror(errno)>"
std::string systemErrorText(const std::string& context, int err);
