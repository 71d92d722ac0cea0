#include "wrapmgr/ManagerServer.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "wrapmgr/common/Config.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>

int main(int argc, char* argv[]) {
    using namespace wrapmgr;

    std::string configFile = "../config/wrapmgr.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    const bool loaded = conf.Load(configFile);
    if (!loaded) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    ManagerServer::Options options = ManagerServer::OptionsFromConfig(conf);
    const auto accounts = ManagerServer::AccountsFromConfig(conf);

    if (checkOnly) {
        if (!loaded) return 1;
        printf("OK listen=%s worker=%s accounts=%zu\n",
               options.listenAddress.c_str(), options.endpoint.host.c_str(), accounts.size());
        return 0;
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));
    const std::string logFile = conf.GetString("global", "log_file", "");
    if (!logFile.empty() && !logger.SetLogFile(logFile)) {
        LOG_WARN << "Cannot open log file " << logFile;
    }

    // Block before any thread exists so gRPC's threads inherit the mask and the
    // signals reach the signalfd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    ManagerServer server(&loop, options);
    if (!server.EnableSignalHandling()) return EXIT_FAILURE;
    if (!server.Start()) return EXIT_FAILURE;
    server.Preregister(accounts);

    LOG_INFO << "Starting wrapper manager on " << options.listenAddress << "...";
    loop.Loop();
    return 0;
}
