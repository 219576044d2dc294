#pragma once

#include <ostream>
#include <string>

#include <sys/types.h>

// ----------------------------------------------------------
// PID-Datei
// ----------------------------------------------------------
class PidFile
{
public:
    explicit PidFile(const std::string& path) : path_(path) {}

    const std::string& path() const { return path_; }

    bool exists() const;

    // throws std::runtime_error
    void write(pid_t pid) const;
    pid_t read() const;

    // missing file is not an error
    void remove() const;

private:
    std::string path_;
};

// Detach from the terminal: fork, setsid, fork, chdir("/"), stdio to
// /dev/null. Only the grandchild returns. Throws std::runtime_error.
void daemonize();

// Installs `handler` for SIGINT and SIGTERM, then writes our PID.
// Anyone who can read the PID file can already stop us cleanly.
void announceDaemon(const PidFile& pidFile, void (*handler)(int));

// Relative paths are anchored at the current directory (before daemonize()).
std::string absolutePath(const std::string& path);

// SIGTERM to the PID in the file, then removes the file.
// Messages go to `out`; returns the process exit code.
int stopDaemon(const PidFile& pidFile, std::ostream& out);
