#include "wrapmgr/ManagerServer.h"
#include "wrapmgr/network/Channel.h"
#include "wrapmgr/monitor/OperationStats.h"
#include "wrapmgr/common/Logger.h"

#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server_builder.h>

#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace wrapmgr {

namespace {

const char kAccountPrefix[] = "account:";

worker::WorkerEndpoint EndpointFromSection(const common::Config& conf,
                                           const std::string& section,
                                           worker::WorkerEndpoint base) {
    base.host = conf.GetString(section, "host", base.host);
    base.decryptPort = static_cast<uint16_t>(conf.GetInt(section, "decrypt_port", base.decryptPort));
    base.m3u8Port = static_cast<uint16_t>(conf.GetInt(section, "m3u8_port", base.m3u8Port));
    base.accountPort = static_cast<uint16_t>(conf.GetInt(section, "account_port", base.accountPort));
    base.callTimeoutSec = conf.GetDouble(section, "timeout_sec", base.callTimeoutSec);
    base.accountTimeoutSec = conf.GetDouble(section, "account_timeout_sec", base.accountTimeoutSec);
    base.m3u8Attempts = conf.GetInt(section, "m3u8_retries", base.m3u8Attempts);
    base.m3u8RetryDelaySec = conf.GetDouble(section, "m3u8_retry_delay_sec", base.m3u8RetryDelaySec);
    base.verifyOnStart = conf.GetBool(section, "verify_on_start", base.verifyOnStart);
    base.batchDecrypt = conf.GetBool(section, "batch_decrypt", base.batchDecrypt);
    return base;
}

} // namespace

ManagerServer::Options ManagerServer::OptionsFromConfig(const common::Config& conf) {
    Options o;
    o.listenAddress = conf.GetString("global", "listen_address", o.listenAddress);
    o.maxMessageBytes = conf.GetInt("global", "max_message_bytes", o.maxMessageBytes);
    o.shutdownGraceSec = conf.GetDouble("global", "shutdown_grace_sec", o.shutdownGraceSec);

    o.endpoint = EndpointFromSection(conf, "worker", o.endpoint);

    o.healthEnabled = conf.GetBool("health", "enable", o.healthEnabled);
    o.health.intervalSec = conf.GetDouble("health", "interval_sec", o.health.intervalSec);
    o.health.probeTimeoutSec = conf.GetDouble("health", "timeout_sec", o.health.probeTimeoutSec);
    o.health.failureThreshold = conf.GetInt("health", "failure_threshold", o.health.failureThreshold);
    o.health.recoveryEnabled = conf.GetBool("health", "recovery_enabled", o.health.recoveryEnabled);
    o.health.maxRecoveryAttempts = conf.GetInt("health", "max_recovery_attempts", o.health.maxRecoveryAttempts);
    o.health.backoffBaseSec = conf.GetDouble("health", "backoff_base_sec", o.health.backoffBaseSec);
    o.health.historyLimit = static_cast<size_t>(
        conf.GetInt("health", "history_limit", static_cast<int>(o.health.historyLimit)));

    o.login.gracePeriodSec = conf.GetDouble("login", "grace_period_sec", o.login.gracePeriodSec);
    o.login.defaultRegion = conf.GetString("login", "default_region", o.login.defaultRegion);
    o.sessionMaxAgeSec = conf.GetDouble("login", "session_max_age_sec", o.sessionMaxAgeSec);
    o.sessionCleanupIntervalSec = conf.GetDouble("login", "cleanup_interval_sec", o.sessionCleanupIntervalSec);

    o.maxIdleSec = conf.GetDouble("instance", "max_idle_sec", o.maxIdleSec);
    o.idleCleanupIntervalSec = conf.GetDouble("instance", "cleanup_interval_sec", o.idleCleanupIntervalSec);

    o.statsLogIntervalSec = conf.GetDouble("stats", "log_interval_sec", o.statsLogIntervalSec);

    o.catalog.host = conf.GetString("catalog", "host", o.catalog.host);
    o.catalog.port = static_cast<uint16_t>(conf.GetInt("catalog", "port", o.catalog.port));
    o.catalog.useTls = conf.GetBool("catalog", "tls", o.catalog.useTls);
    o.catalog.verifyPeer = conf.GetBool("catalog", "verify_peer", o.catalog.verifyPeer);
    o.catalog.caFile = conf.GetString("catalog", "ca_file", o.catalog.caFile);
    o.catalog.timeoutSec = conf.GetDouble("catalog", "timeout_sec", o.catalog.timeoutSec);
    o.catalog.maxInFlight = static_cast<size_t>(
        conf.GetInt("catalog", "max_in_flight", static_cast<int>(o.catalog.maxInFlight)));

    for (const auto& section : conf.GetSectionsWithPrefix(kAccountPrefix)) {
        const std::string username = section.first.substr(sizeof(kAccountPrefix) - 1);
        if (username.empty()) continue;
        const std::string region = conf.GetString(section.first, "region");
        if (!region.empty()) o.accountRegions[username] = region;
        if (section.second.count("host") || section.second.count("decrypt_port") ||
            section.second.count("m3u8_port") || section.second.count("account_port")) {
            o.accountEndpoints[username] = EndpointFromSection(conf, section.first, o.endpoint);
        }
    }
    return o;
}

std::vector<ManagerServer::AccountSeed> ManagerServer::AccountsFromConfig(const common::Config& conf) {
    std::vector<AccountSeed> seeds;
    for (const auto& section : conf.GetSectionsWithPrefix(kAccountPrefix)) {
        AccountSeed seed;
        seed.username = section.first.substr(sizeof(kAccountPrefix) - 1);
        seed.password = conf.GetString(section.first, "password");
        seed.region = conf.GetString(section.first, "region");
        if (seed.username.empty() || seed.password.empty()) continue;
        seeds.push_back(seed);
    }
    return seeds;
}

ManagerServer::ManagerServer(network::EventLoop* loop, Options options)
    : ManagerServer(loop, std::move(options), nullptr) {
}

ManagerServer::ManagerServer(network::EventLoop* loop, Options options, worker::ProxyFactory factory)
    : loop_(loop),
      options_(std::move(options)) {
    pool_.reset(new balancer::InstancePool(loop_, factory ? std::move(factory) : DefaultFactory()));
    dispatcher_.reset(new balancer::Dispatcher(pool_.get()));
    monitor_.reset(new monitor::HealthMonitor(loop_, pool_.get(), options_.health));
    auto regions = options_.accountRegions;
    sessions_.reset(new session::LoginSessionManager(
        loop_, pool_.get(),
        [regions](const std::string& username) {
            auto it = regions.find(username);
            return it == regions.end() ? std::string() : it->second;
        },
        options_.login));
    catalog_.reset(new catalog::CatalogClient(loop_, options_.catalog));
    service_.reset(new service::ManagerService(loop_, pool_.get(), dispatcher_.get(), sessions_.get(), catalog_.get()));
    WireMonitorCallbacks();
}

ManagerServer::~ManagerServer() {
    if (drainThread_.joinable()) drainThread_.join();
    if (server_) server_->Shutdown(std::chrono::system_clock::now());
    for (auto id : timers_) loop_->Cancel(id);
    if (signalChannel_) {
        signalChannel_->DisableAll();
        signalChannel_->Remove();
    }
    if (signalFd_ >= 0) ::close(signalFd_);
    if (monitor_) monitor_->Stop();
}

worker::ProxyFactory ManagerServer::DefaultFactory() {
    network::EventLoop* loop = loop_;
    const worker::WorkerEndpoint endpoint = options_.endpoint;
    const auto overrides = options_.accountEndpoints;
    return [loop, endpoint, overrides](const worker::WorkerSpec& spec) -> worker::WorkerProxyPtr {
        auto it = overrides.find(spec.username);
        return std::make_shared<worker::SocketWorkerProxy>(
            loop, spec.instanceId, it == overrides.end() ? endpoint : it->second);
    };
}

void ManagerServer::WireMonitorCallbacks() {
    monitor_->SetHealthChangeCallback([](const std::string& id, const monitor::HealthCheckResult& r) {
        if (r.status != monitor::HealthStatus::kHealthy) {
            LOG_WARN << "Instance " << id << " is " << monitor::HealthStatusName(r.status)
                     << " (failures=" << r.consecutiveFailures << "): " << r.error;
        }
    });
    monitor_->SetRecoveryStartCallback([](const monitor::RecoveryAction& action) {
        monitor::OperationStats::Instance().IncCounter("recovery_started");
        LOG_INFO << "Recovering instance " << action.instanceId << ": " << action.reason;
    });
    monitor_->SetRecoveryCompleteCallback([](const std::string& id, bool success, const std::string& message) {
        monitor::OperationStats::Instance().IncCounter(success ? "recovery_succeeded" : "recovery_failed");
        if (success) {
            LOG_INFO << "Instance " << id << " recovered";
        } else {
            LOG_WARN << "Recovery of " << id << " failed: " << message;
        }
    });
}

bool ManagerServer::Start() {
    if (!catalog_->Init()) {
        LOG_WARN << "Catalog client unavailable, Lyrics calls will fail";
    }

    grpc::ServerBuilder builder;
    builder.AddListeningPort(options_.listenAddress, grpc::InsecureServerCredentials(), &selectedPort_);
    builder.SetMaxReceiveMessageSize(options_.maxMessageBytes);
    builder.SetMaxSendMessageSize(options_.maxMessageBytes);
    builder.RegisterCallbackGenericService(service_.get());
    server_ = builder.BuildAndStart();
    if (!server_ || selectedPort_ == 0) {
        LOG_ERROR << "Cannot listen on " << options_.listenAddress;
        server_.reset();
        return false;
    }

    if (options_.healthEnabled) monitor_->Start();
    StartPeriodicJobs();
    service_->SetReady(true);
    LOG_INFO << "Wrapper manager listening on " << options_.listenAddress << " (port " << selectedPort_ << ")";
    return true;
}

void ManagerServer::Preregister(const std::vector<AccountSeed>& accounts) {
    for (const auto& seed : accounts) {
        const std::string region = seed.region.empty() ? options_.login.defaultRegion : seed.region;
        const std::string username = seed.username;
        pool_->Add(username, seed.password, region, std::string(),
                   [username](const balancer::InstancePool::AddResult& r) {
            if (r.ok) {
                LOG_INFO << "Pre-registered account " << username;
            } else {
                LOG_WARN << "Cannot pre-register " << username << ": " << r.message;
            }
        });
    }
}

void ManagerServer::StartPeriodicJobs() {
    if (options_.maxIdleSec > 0 && options_.idleCleanupIntervalSec > 0) {
        timers_.push_back(loop_->RunEvery(options_.idleCleanupIntervalSec, [this]() {
            const int removed = pool_->CleanupIdle(options_.maxIdleSec);
            if (removed > 0) LOG_INFO << "Removed " << removed << " idle instances";
        }));
    }
    if (options_.sessionCleanupIntervalSec > 0) {
        timers_.push_back(loop_->RunEvery(options_.sessionCleanupIntervalSec, [this]() {
            sessions_->CleanupExpired(options_.sessionMaxAgeSec);
        }));
    }
    if (options_.statsLogIntervalSec > 0) {
        timers_.push_back(loop_->RunEvery(options_.statsLogIntervalSec, [this]() { LogStats(); }));
    }
}

void ManagerServer::LogStats() {
    auto& stats = monitor::OperationStats::Instance();
    const balancer::DispatcherStatistics d = dispatcher_->GetStatistics();
    stats.SetGauge("instances", d.totalInstances);
    stats.SetGauge("active_instances", d.activeInstances);
    stats.SetGauge("busy_instances", d.busyInstances);
    stats.SetGauge("login_sessions", static_cast<double>(sessions_->SessionCount()));
    LOG_INFO << "Stats: " << stats.ToJson();
}

void ManagerServer::Shutdown(std::function<void()> done) {
    if (shuttingDown_) return;
    shuttingDown_ = true;
    LOG_INFO << "Shutting down wrapper manager";

    service_->SetReady(false);
    monitor_->Stop();
    catalog_->Shutdown();
    for (auto id : timers_) loop_->Cancel(id);
    timers_.clear();

    // Server::Shutdown blocks until running calls finish, and those calls need
    // this loop, so it runs on a helper thread.
    grpc::Server* server = server_.get();
    const double grace = options_.shutdownGraceSec;
    network::EventLoop* loop = loop_;
    drainThread_ = std::thread([this, server, grace, loop, done]() {
        if (server) {
            server->Shutdown(std::chrono::system_clock::now() +
                             std::chrono::milliseconds(static_cast<long long>(grace * 1000)));
        }
        loop->QueueInLoop([this, done]() {
            pool_->ShutdownAll();
            LOG_INFO << "Wrapper manager stopped";
            if (done) done();
        });
    });
}

bool ManagerServer::EnableSignalHandling() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    signalFd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signalFd_ < 0) {
        LOG_ERROR << "signalfd failed: " << std::strerror(errno);
        return false;
    }
    signalChannel_.reset(new network::Channel(loop_, signalFd_));
    signalChannel_->SetReadCallback([this]() { HandleSignal(); });
    signalChannel_->EnableReading();
    return true;
}

void ManagerServer::HandleSignal() {
    struct signalfd_siginfo info;
    const ssize_t n = ::read(signalFd_, &info, sizeof info);
    if (n != static_cast<ssize_t>(sizeof info)) return;
    LOG_INFO << "Received signal " << info.ssi_signo;
    network::EventLoop* loop = loop_;
    Shutdown([loop]() { loop->Quit(); });
}

} // namespace wrapmgr
