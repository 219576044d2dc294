#include <iostream>
#include <string>
#include <unistd.h>

#include "coordinator.h"
#include "daemon.h"
#include "logger.h"
#include "options.h"
#include "run_flag.h"

// Global flag for clean shutdown
static RunFlag running;

void signalHandler(int)
{
    running.stop();
}

static int startDaemon(const Options& opts)
{
    const PidFile pidFile(absolutePath(expandUser(opts.pidFile)));
    const std::string logPath = absolutePath(expandUser(opts.logFile));

    logger.setVerbose(opts.verbose);

    if (!opts.foreground)
    {
        // open before detaching so a bad path is still reported on the terminal
        if (!logger.openFile(logPath, true))
        {
            std::cerr << "Cannot open log file " << logPath << "\n";
            return 1;
        }
        daemonize();
    }

    announceDaemon(pidFile, signalHandler);

    // -------------------------------------------------------
    // Beide Loops laufen bis SIGTERM / SIGINT
    // -------------------------------------------------------
    runDaemon(opts.ipAddress, running);

    pidFile.remove();
    return 0;
}

int main(int argc, char* argv[])
{
    Options opts;
    std::string error;

    if (!parseOptions(argc, argv, opts, error))
    {
        std::cerr << usage(argv[0]) << "\n" << argv[0] << ": error: " << error << "\n";
        return 2;
    }
    if (opts.help)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    if (opts.action == Action::Stop)
    {
        return stopDaemon(PidFile(absolutePath(expandUser(opts.pidFile))), std::cout);
    }

    try
    {
        return startDaemon(opts);
    }
    catch (const std::exception& e)
    {
        // after daemonize() stderr is /dev/null, the log file is what is left
        LOG_ERROR(std::string("Fatal: ") + e.what());
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return 1;
    }
}
