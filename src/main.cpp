#include "relay/RelayServer.h"
#include "relay/ProxyConfig.h"
#include "relay/network/EventLoop.h"
#include "relay/network/SignalWatcher.h"
#include "relay/common/Config.h"
#include "relay/common/Logger.h"

#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static void Usage(const char* prog) {
    printf("Usage: %s [-c config_file] [-e env_file] [-C]\n", prog);
    printf("  -c  INI config file (optional)\n");
    printf("  -e  dotenv file, default ./.env\n");
    printf("  -C  check config, print the effective settings and exit\n");
}

int main(int argc, char* argv[]) {
    using namespace relay;

    std::string configFile;
    std::string envFile = ".env";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:e:Ch")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'e':
                envFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                Usage(argv[0]);
                return 0;
            default:
                Usage(argv[0]);
                return 1;
        }
    }

    common::Config::LoadEnvFile(envFile);

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_ERROR << "Cannot read config file " << configFile;
        return 1;
    }

    ProxyConfig config;
    std::string error;
    if (!ProxyConfig::Load(conf, ProxyConfig::ProcessEnv(), &config, &error)) {
        LOG_ERROR << "Error: " << error;
        return 1;
    }
    common::Logger::Instance().SetLevel(config.logLevel());

    if (checkOnly) {
        printf("%s", config.Describe().c_str());
        printf("OK\n");
        return 0;
    }

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    RelayServer* serverPtr = nullptr;
    int signalsSeen = 0;
    // Before any I/O thread exists, so every thread inherits the blocked mask.
    network::SignalWatcher signals(&loop, {SIGINT, SIGTERM}, [&](int signo) {
        if (++signalsSeen > 1) {
            LOG_WARN << "second signal " << signo << ", exiting immediately";
            ::_exit(1);
        }
        LOG_INFO << "signal " << signo << " received, shutting down";
        if (serverPtr) {
            serverPtr->Shutdown(config.drainSec(), [&loop]() { loop.Quit(); });
        } else {
            loop.Quit();
        }
    });
    if (!signals.ok()) {
        LOG_ERROR << "signalfd setup failed";
        return 1;
    }

    RelayServer server(&loop, config);
    if (!server.Start(&error)) {
        LOG_ERROR << "relayd failed to start: " << error;
        return 1;
    }
    serverPtr = &server;

    loop.Loop();
    LOG_INFO << "relayd stopped";
    return 0;
}
