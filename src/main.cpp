#include "conduit/ObserverConfig.h"
#include "conduit/common/Config.h"
#include "conduit/common/Logger.h"
#include "conduit/tracing/RequestIdManager.h"

#include <getopt.h>
#include <unistd.h>
#include <cstdio>
#include <string>

// Validates an observability config and prints the resolved settings.
int main(int argc, char* argv[]) {
    using namespace conduit;

    std::string configFile = "../config/conduit.conf";
    bool sampleId = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:gh")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'g':
                sampleId = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-g]\n", argv[0]);
                printf("  -g  also print a freshly generated request id\n");
                return 0;
        }
    }

    if (!common::Config::Instance().Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile;
        return 1;
    }

    const ObserverConfig cfg = ObserverConfig::FromConfig(common::Config::Instance());
    common::Logger::Instance().SetLevel(cfg.logLevel);

    printf("%s", cfg.Describe().c_str());
    if (sampleId) {
        printf("sample_request_id=%s\n", tracing::RequestIdManager::GenerateId().c_str());
    }
    printf("OK\n");
    return 0;
}
