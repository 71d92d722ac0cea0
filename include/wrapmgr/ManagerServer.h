#pragma once

#include "wrapmgr/balancer/Dispatcher.h"
#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/catalog/CatalogClient.h"
#include "wrapmgr/common/Config.h"
#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/monitor/HealthMonitor.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/service/ManagerService.h"
#include "wrapmgr/session/LoginSessionManager.h"
#include "wrapmgr/worker/SocketWorkerProxy.h"

#include <grpcpp/server.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace wrapmgr {

namespace network {
class Channel;
}

// Owns every component of the manager and the gRPC server in front of them.
// Construct, Start() and Shutdown() on the loop thread.
class ManagerServer : wrapmgr::common::noncopyable {
public:
    struct Options {
        std::string listenAddress{"0.0.0.0:18923"};
        int maxMessageBytes{64 * 1024 * 1024};
        double shutdownGraceSec{5.0};

        worker::WorkerEndpoint endpoint;
        // Per-account overrides from [account:<user>] sections.
        std::map<std::string, worker::WorkerEndpoint> accountEndpoints;
        std::map<std::string, std::string> accountRegions;

        bool healthEnabled{true};
        monitor::HealthMonitor::Options health;

        session::LoginSessionManager::Options login;
        double sessionMaxAgeSec{600.0};
        double sessionCleanupIntervalSec{60.0};

        double maxIdleSec{0.0}; // 0 disables idle cleanup
        double idleCleanupIntervalSec{300.0};

        double statsLogIntervalSec{0.0}; // 0 disables

        catalog::CatalogClient::Options catalog;
    };

    struct AccountSeed {
        std::string username;
        std::string password;
        std::string region;
    };

    static Options OptionsFromConfig(const common::Config& conf);
    // [account:<user>] sections that carry a password.
    static std::vector<AccountSeed> AccountsFromConfig(const common::Config& conf);

    ManagerServer(network::EventLoop* loop, Options options);
    // Tests inject their own proxies.
    ManagerServer(network::EventLoop* loop, Options options, worker::ProxyFactory factory);
    ~ManagerServer();

    // Binds the gRPC listener and starts the monitor and periodic jobs.
    bool Start();
    void Preregister(const std::vector<AccountSeed>& accounts);

    // Stops accepting calls, lets running calls drain for shutdownGraceSec,
    // then stops every proxy. done runs on the loop thread.
    void Shutdown(std::function<void()> done);

    // SIGINT/SIGTERM (already blocked by the caller) trigger Shutdown and then
    // quit the loop.
    bool EnableSignalHandling();

    int port() const { return selectedPort_; }

    balancer::InstancePool* pool() { return pool_.get(); }
    balancer::Dispatcher* dispatcher() { return dispatcher_.get(); }
    monitor::HealthMonitor* monitor() { return monitor_.get(); }
    session::LoginSessionManager* sessions() { return sessions_.get(); }
    service::ManagerService* service() { return service_.get(); }

private:
    worker::ProxyFactory DefaultFactory();
    void WireMonitorCallbacks();
    void StartPeriodicJobs();
    void LogStats();
    void HandleSignal();

    network::EventLoop* loop_;
    Options options_;

    std::unique_ptr<balancer::InstancePool> pool_;
    std::unique_ptr<balancer::Dispatcher> dispatcher_;
    std::unique_ptr<monitor::HealthMonitor> monitor_;
    std::unique_ptr<session::LoginSessionManager> sessions_;
    std::unique_ptr<catalog::CatalogClient> catalog_;
    std::unique_ptr<service::ManagerService> service_;
    std::unique_ptr<grpc::Server> server_;
    int selectedPort_{0};

    std::vector<network::TimerId> timers_;
    bool shuttingDown_{false};
    std::thread drainThread_;

    int signalFd_{-1};
    std::unique_ptr<network::Channel> signalChannel_;
};

} // namespace wrapmgr
