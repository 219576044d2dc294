// cpp/src/options.cpp
#include "options.h"

#include <getopt.h>

#include <cstdlib>
#include <sstream>

bool parseOptions(int argc, char* argv[], Options& options, std::string& error) {
    static const option longOptions[] = {
        {"log",        required_argument, nullptr, 'l'},
        {"ip_address", required_argument, nullptr, 'i'},
        {"pid-file",   required_argument, nullptr, 'p'},
        {"verbose",    no_argument,       nullptr, 'v'},
        {"foreground", no_argument,       nullptr, 'f'},
        {"help",       no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    options = Options();
    optind = 0;   // full re-init (GNU), parseOptions may run more than once
    opterr = 0;

    int c;
    while ((c = getopt_long_only(argc, argv, ":l:i:p:vfh", longOptions, nullptr)) != -1) {
        switch (c) {
            case 'l': options.logFile = optarg; break;
            case 'i': options.ipAddress = optarg; break;
            case 'p': options.pidFile = optarg; break;
            case 'v': options.verbose = true; break;
            case 'f': options.foreground = true; break;
            case 'h': options.help = true; return true;
            case ':':
                error = std::string("missing argument for ") + argv[optind - 1];
                return false;
            default:
                error = std::string("unknown option ") + argv[optind - 1];
                return false;
        }
    }

    if (optind >= argc) {
        error = "missing action (start or stop)";
        return false;
    }

    std::string action = argv[optind++];
    if (action == "start") {
        options.action = Action::Start;
    } else if (action == "stop") {
        options.action = Action::Stop;
    } else {
        error = "invalid action '" + action + "' (choose from start, stop)";
        return false;
    }

    if (optind < argc) {
        error = std::string("unexpected argument ") + argv[optind];
        return false;
    }
    return true;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "usage: " << program << " [options] {start,stop}\n"
        << "\n"
        << "Daemon for controlling LED lights with SpaceNav\n"
        << "\n"
        << "  -l, --log LOG_FILE            log file location (default " << kDefaultLogFile << ")\n"
        << "  -i, --ip_address IP_ADDRESS   IP address or hostname of the WLED device\n"
        << "                                (default " << kDefaultFixtureAddress << ")\n"
        << "  -p, --pid-file PID_FILE       PID file location (default " << kDefaultPidFile << ")\n"
        << "  -v, --verbose                 enable verbose logging\n"
        << "  -f, --foreground              do not detach, log to stderr\n"
        << "  -h, --help                    show this help\n";
    return oss.str();
}

std::string expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;   // ~user is not supported

    const char* home = std::getenv("HOME");
    if (home == nullptr) return path;
    return std::string(home) + path.substr(1);
}
