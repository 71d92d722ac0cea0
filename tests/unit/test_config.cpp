#include "wrapmgr/ManagerServer.h"
#include "wrapmgr/common/Config.h"
#include "wrapmgr/common/Logger.h"

#include <cassert>

using namespace wrapmgr;

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);

    auto& conf = common::Config::Instance();
    const bool ok = conf.LoadFromString(
        "# comment\n"
        "[global]\n"
        "listen_address = 127.0.0.1:19000\n"
        "log_level = DEBUG\n"
        "[worker]\n"
        "host = 10.0.0.5\n"
        "decrypt_port = 11000\n"
        "m3u8_retries = 5\n"
        "batch_decrypt = off\n"
        "[health]\n"
        "interval_sec = 12.5\n"
        "failure_threshold = 4\n"
        "recovery_enabled = no\n"
        "[instance]\n"
        "max_idle_sec = 3600\n"
        "[catalog]\n"
        "max_in_flight = 4\n"
        "[account:alice@example.com]\n"
        "password = pw1\n"
        "region = JP\n"
        "decrypt_port = 12000\n"
        "[account:bob@example.com]\n"
        "region = gb\n");
    assert(ok);

    assert(conf.GetString("global", "log_level") == "DEBUG");
    assert(conf.GetInt("worker", "decrypt_port", 0) == 11000);
    assert(conf.GetDouble("health", "interval_sec", 0.0) == 12.5);
    assert(!conf.GetBool("worker", "batch_decrypt", true));
    assert(conf.GetBool("worker", "missing", true));
    assert(conf.GetSectionsWithPrefix("account:").size() == 2);

    ManagerServer::Options o = ManagerServer::OptionsFromConfig(conf);
    assert(o.listenAddress == "127.0.0.1:19000");
    assert(o.endpoint.host == "10.0.0.5");
    assert(o.endpoint.decryptPort == 11000);
    assert(o.endpoint.m3u8Port == 20020);
    assert(o.endpoint.m3u8Attempts == 5);
    assert(!o.endpoint.batchDecrypt);
    assert(o.health.intervalSec == 12.5);
    assert(o.health.failureThreshold == 4);
    assert(!o.health.recoveryEnabled);
    assert(o.maxIdleSec == 3600);
    assert(o.catalog.maxInFlight == 4);
    assert(o.catalog.port == 443);
    assert(o.accountRegions.at("alice@example.com") == "JP");
    assert(o.accountRegions.at("bob@example.com") == "gb");
    assert(o.accountEndpoints.count("alice@example.com") == 1);
    assert(o.accountEndpoints.at("alice@example.com").decryptPort == 12000);
    assert(o.accountEndpoints.at("alice@example.com").host == "10.0.0.5");
    assert(o.accountEndpoints.count("bob@example.com") == 0);

    // Only accounts with a password are pre-registered.
    const auto seeds = ManagerServer::AccountsFromConfig(conf);
    assert(seeds.size() == 1);
    assert(seeds[0].username == "alice@example.com");
    assert(seeds[0].password == "pw1");
    assert(seeds[0].region == "JP");

    LOG_INFO << "Config: PASS";
    return 0;
}
