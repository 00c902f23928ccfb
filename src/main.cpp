#include "webgate/ProxyServer.h"
#include "webgate/network/Channel.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/Resolver.h"
#include "webgate/network/TlsContext.h"
#include "webgate/common/Logger.h"
#include "webgate/common/Config.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

// -C: everything that would make Start() or a request fail because of the file itself.
bool CheckConfig(const webgate::ProxyOptions& options, std::string* problem) {
    for (const auto& spec : options.resolve) {
        std::string host;
        uint16_t port = 0;
        webgate::network::InetAddress addr;
        if (!webgate::network::Resolver::ParseOverride(spec, &host, &port, &addr)) {
            *problem = "bad [upstream] resolve entry '" + spec + "'";
            return false;
        }
    }
    if (options.tlsEnable) {
        webgate::network::TlsContext tls;
        if (!tls.InitServer(options.certPath, options.keyPath)) {
            *problem = "cannot load [tls] cert_path/key_path";
            return false;
        }
    }
    webgate::network::TlsContext upstreamTls;
    if (!upstreamTls.InitClient(options.tlsVerify, options.caFile)) {
        *problem = "cannot set up the upstream TLS context (ca_file=" + options.caFile + ")";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace webgate;

    std::string configFile = "webgate.conf";
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
    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));
    const ProxyOptions options = ProxyOptions::FromConfig(conf);

    if (checkOnly) {
        // Exit code indicates success/failure for management scripts/CI.
        std::string problem;
        if (!loaded) {
            printf("FAIL: cannot read %s\n", configFile.c_str());
            return 1;
        }
        if (!CheckConfig(options, &problem)) {
            printf("FAIL: %s\n", problem.c_str());
            return 1;
        }
        printf("OK\n");
        return 0;
    }

    // SIGTERM/SIGINT are read from a signalfd on the base loop. Blocked before any
    // thread starts so every I/O thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGINT);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_FATAL << "pthread_sigmask failed";
        return 1;
    }
    std::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    ProxyServer server(&loop, options);

    const int sigfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigfd < 0) {
        LOG_FATAL << "signalfd failed: " << std::strerror(errno);
        return 1;
    }
    network::Channel signalChannel(&loop, sigfd);
    signalChannel.SetReadCallback([&server, sigfd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        const ssize_t n = ::read(sigfd, &info, sizeof info);
        if (n != static_cast<ssize_t>(sizeof info)) return;
        LOG_INFO << "Received " << strsignal(static_cast<int>(info.ssi_signo));
        printf("Leaving...\n");
        fflush(stdout);
        server.Stop();
    });
    signalChannel.EnableReading();

    if (!server.Start()) {
        LOG_FATAL << "Failed to start on port " << options.port;
        signalChannel.DisableAll();
        signalChannel.Remove();
        ::close(sigfd);
        return 1;
    }
    printf("Launched\n");
    fflush(stdout);

    loop.Loop();

    signalChannel.DisableAll();
    signalChannel.Remove();
    ::close(sigfd);
    return 0;
}
