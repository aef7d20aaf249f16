// stasd: NVMe-oF STorage Appliance Services daemon.
#include <csignal>
#include <cstdio>
#include <cstring>
#include <pthread.h>
#include <string>
#include <thread>

#include "configuration/config_loader.h"
#include "dispatcher/worker_pool.h"
#include "kernel/libnvme_control.h"
#include "kernel/topology_inventory.h"
#include "kernel/uevent_listener.h"
#include "stas_engine.h"
#include "utils/log_pump.h"
#include "utils/stas_logger.h"

namespace {

constexpr size_t kWorkerThreads = 4;

struct CommandLine {
    std::string conf_file = nvmestas::config::kDefaultConfFile;
    bool use_syslog = false;
    bool tron = false;
    bool show_version = false;
    bool show_help = false;
};

void usage(const char* program) {
    std::printf("Usage: %s [options]\n"
                "\n"
                "  -f, --conf-file FILE   configuration file (default %s)\n"
                "  -s, --syslog           send log messages to syslog instead of stderr\n"
                "      --tron             trace on (debug level logging)\n"
                "  -v, --version          print the version and exit\n"
                "  -h, --help             this help\n",
                program,
                nvmestas::config::kDefaultConfFile);
}

int process_command_line(int argc, char* argv[], CommandLine& out) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-f") == 0 || std::strcmp(argv[i], "--conf-file") == 0) {
            if (++i >= argc) {
                std::fprintf(stderr, "Option %s requires an argument.\n", argv[i - 1]);
                return -1;
            }
            out.conf_file = argv[i];
        } else if (std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--syslog") == 0) {
            out.use_syslog = true;
        } else if (std::strcmp(argv[i], "--tron") == 0) {
            out.tron = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            out.show_version = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            out.show_help = true;
        } else {
            std::fprintf(stderr, "Unknown option \"%s\". Please try --help.\n", argv[i]);
            return -1;
        }
    }
    return 0;
}

// SIGHUP reloads, SIGTERM/SIGINT stop. The signals are blocked in every thread and
// collected here, so the engine only ever sees ordinary posted requests.
void signal_loop(const sigset_t* signals, nvmestas::engine::StasEngine* engine) {
    while (true) {
        int signum = 0;
        if (sigwait(signals, &signum) != 0) {
            continue;
        }
        if (signum == SIGHUP) {
            LOG_STAS_INFO("SIGHUP received, reloading configuration.");
            engine->request_reload();
        } else {
            LOG_STAS_INFO("Signal %d received, stopping.", signum);
            engine->request_stop();
            return;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace nvmestas;

    CommandLine options;
    if (process_command_line(argc, argv, options) < 0) {
        usage(argv[0]);
        return 2;
    }
    if (options.show_help) {
        usage(argv[0]);
        return 0;
    }
    if (options.show_version) {
        std::printf("stasd %s\n", engine::StasEngine::version());
        return 0;
    }

    engine::logging::LogPump log_pump("stasd", options.use_syslog);
    log_pump.start();

    config::ConfigLoader loader;
    config::StasConfig stas_config;
    if (!loader.load_file(options.conf_file, stas_config)) {
        LOG_STAS_WARNING("Cannot read %s, using defaults.", options.conf_file.c_str());
    }
    if (options.tron) {
        stas_config.global.tron = true;
    }
    if (stas_config.host.nqn.empty()) {
        LOG_STAS_ERROR("No host NQN. Set [Host] nqn= or create %s.", config::kDefaultHostNqnFile);
        log_pump.stop();
        return 1;
    }

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGHUP);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    engine::SteadyClock clock;
    engine::WorkerPool workers(kWorkerThreads);
    engine::LibnvmeControl nvme;
    engine::TopologyInventory inventory;
    engine::UeventListener uevents;

    int exit_code = 0;
    {
        engine::EngineDependencies deps{clock, workers, nvme, inventory, nullptr};
        engine::StasEngine stas(std::move(stas_config), deps);

        workers.start();
        uevents.set_event_callback([&stas](const engine::DeviceEvent& event) { stas.post_device_event(event); });
        if (!uevents.start()) {
            LOG_STAS_WARNING("Kernel events unavailable, lost connections are only noticed by the next audit.");
        }

        if (stas.start()) {
            std::thread signal_thread(signal_loop, &signals, &stas);
            stas.run();
            // The loop only exits after a stop request, which ended the signal thread.
            signal_thread.join();
        } else {
            exit_code = 1;
        }

        uevents.stop();
        workers.stop();
    }

    LOG_STAS_INFO("stasd exiting.");
    log_pump.stop();
    return exit_code;
}
