// cpp/src/daemon.cpp
#include "daemon.h"
#include "errors.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <stdexcept>

// -----------------------------
// PidFile
// -----------------------------
bool PidFile::exists() const {
    return access(path_.c_str(), F_OK) == 0;
}

void PidFile::write(pid_t pid) const {
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(systemErrorText("cannot write PID file " + path_, errno));
    }
    out << pid << "\n";
    if (!out.flush()) {
        throw std::runtime_error("cannot write PID file " + path_);
    }
}

pid_t PidFile::read() const {
    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error(systemErrorText("cannot read PID file " + path_, errno));
    }
    long pid = 0;
    if (!(in >> pid) || pid <= 0) {
        throw std::runtime_error("PID file " + path_ + " does not contain a valid PID");
    }
    return static_cast<pid_t>(pid);
}

void PidFile::remove() const {
    if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
        throw std::runtime_error(systemErrorText("cannot remove PID file " + path_, errno));
    }
}

// -----------------------------
// Daemonize
// -----------------------------
static void forkAndLeave() {
    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(systemErrorText("fork", errno));
    }
    if (pid > 0) {
        _exit(0);   // parent
    }
}

void daemonize() {
    forkAndLeave();

    if (setsid() < 0) {
        throw std::runtime_error(systemErrorText("setsid", errno));
    }

    // no controlling terminal can be re-acquired after the second fork
    forkAndLeave();

    umask(022);
    if (chdir("/") < 0) {
        throw std::runtime_error(systemErrorText("chdir /", errno));
    }

    int devNull = open("/dev/null", O_RDWR);
    if (devNull < 0) {
        throw std::runtime_error(systemErrorText("open /dev/null", errno));
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (dup2(devNull, fd) < 0) {
            int err = errno;
            close(devNull);
            throw std::runtime_error(systemErrorText("dup2 /dev/null", err));
        }
    }
    if (devNull > STDERR_FILENO) close(devNull);
}

void announceDaemon(const PidFile& pidFile, void (*handler)(int)) {
    for (int sig : {SIGINT, SIGTERM}) {
        if (signal(sig, handler) == SIG_ERR) {
            throw std::runtime_error(systemErrorText("signal", errno));
        }
    }
    pidFile.write(getpid());
}

std::string absolutePath(const std::string& path) {
    if (path.empty() || path[0] == '/') return path;

    char cwd[4096];
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        throw std::runtime_error(systemErrorText("getcwd", errno));
    }
    return std::string(cwd) + "/" + path;
}

// -----------------------------
// stop
// -----------------------------
int stopDaemon(const PidFile& pidFile, std::ostream& out) {
    if (!pidFile.exists()) {
        out << "PID file does not exist. Daemon may not be running." << std::endl;
        return 1;
    }

    int rc = 0;
    try {
        pid_t pid = pidFile.read();
        if (kill(pid, SIGTERM) < 0) {
            if (errno == ESRCH) {
                out << "PID file exists but no process running. Removing stale PID file." << std::endl;
            } else {
                out << systemErrorText("Cannot signal process " + std::to_string(pid), errno) << std::endl;
                rc = 1;
            }
        } else {
            out << "Daemon stopped successfully." << std::endl;
        }
    } catch (const std::runtime_error& e) {
        out << e.what() << ". Removing PID file." << std::endl;
        rc = 1;
    }

    try {
        pidFile.remove();
    } catch (const std::runtime_error& e) {
        out << e.what() << std::endl;
        rc = 1;
    }
    return rc;
}
