#pragma once

#include <string>

static constexpr const char* kDefaultLogFile = "~/daemon.log";
static constexpr const char* kDefaultFixtureAddress = "cctwled.local";
static constexpr const char* kDefaultPidFile = "~/.spacelightd.pid";

enum class Action
{
    None,
    Start,
    Stop
};

struct Options
{
    Action action = Action::None;
    std::string logFile = kDefaultLogFile;
    std::string ipAddress = kDefaultFixtureAddress;
    std::string pidFile = kDefaultPidFile;
    bool verbose = false;
    bool foreground = false;
    bool help = false;
};

// Parses `spacelightd [options] start|stop`. On failure returns false and
// sets `error`. Single-dash long forms (-ip, -log) are accepted too.
bool parseOptions(int argc, char* argv[], Options& options, std::string& error);

std::string usage(const std::string& program);

// "~/x" -> "$HOME/x"
std::string expandUser(const std::string& path);
