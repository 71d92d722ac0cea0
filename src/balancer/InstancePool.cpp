#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "wrapmgr/common/Uuid.h"

namespace wrapmgr {
namespace balancer {

namespace {
const char* const kInstanceNamespace = "77777777-7777-7777-7777-777777777777";
}

const char* InstanceStatusName(InstanceStatus s) {
    switch (s) {
        case InstanceStatus::kInitializing: return "initializing";
        case InstanceStatus::kActive: return "active";
        case InstanceStatus::kFailed: return "failed";
        case InstanceStatus::kStopped: return "stopped";
    }
    return "unknown";
}

double Instance::IdleSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - lastUsed).count();
}

InstancePool::InstancePool(network::EventLoop* loop, worker::ProxyFactory factory)
    : loop_(loop),
      factory_(std::move(factory)) {
}

InstancePool::~InstancePool() {
    ShutdownAll();
}

std::string InstancePool::MakeInstanceId(const std::string& username) {
    return common::Uuid5(kInstanceNamespace, username);
}

void InstancePool::Add(const std::string& username,
                       const std::string& password,
                       const std::string& region,
                       const std::string& twoFactorCode,
                       AddCallback cb) {
    const std::string instanceId = MakeInstanceId(username);

    auto failLater = [this, cb](AddFailure failure, std::string message, InstancePtr existing) {
        loop_->QueueInLoop([cb, failure, message, existing]() {
            AddResult result;
            result.failure = failure;
            result.message = message;
            result.instance = existing;
            cb(result);
        });
    };

    if (instanceId.empty()) {
        failLater(AddFailure::kStartFailed, "Cannot derive instance id for " + username, nullptr);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(instanceId);
        if (it != instances_.end() || pending_.count(instanceId)) {
            InstancePtr existing = (it != instances_.end()) ? it->second : nullptr;
            failLater(AddFailure::kAlreadyExists, "Account " + username + " already exists", existing);
            return;
        }
        pending_.insert(instanceId);
        shutdown_ = false;
    }

    worker::WorkerSpec spec;
    spec.instanceId = instanceId;
    spec.username = username;
    spec.password = password;
    spec.region = region;
    spec.twoFactorCode = twoFactorCode;

    worker::WorkerProxyPtr proxy = factory_ ? factory_(spec) : nullptr;
    if (!proxy) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(instanceId);
        }
        LOG_ERROR << "Failed to add instance " << username << ": no proxy for " << instanceId;
        failLater(AddFailure::kStartFailed, "Failed to add account: no worker proxy", nullptr);
        return;
    }

    proxy->Start([this, proxy, instanceId, username, region, cb](const worker::StartResult& started) {
        AddResult result;
        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned = pending_.erase(instanceId) == 0 || shutdown_;
            if (started.ok && !abandoned) {
                auto instance = std::make_shared<Instance>();
                instance->instanceId = instanceId;
                instance->username = username;
                instance->region = region;
                instance->status = InstanceStatus::kActive;
                instance->createdAt = std::chrono::system_clock::now();
                instance->createdSteady = std::chrono::steady_clock::now();
                instance->lastUsed = instance->createdSteady;
                instance->proxy = proxy;
                instances_[instanceId] = instance;
                usernameToId_[username] = instanceId;
                result.ok = true;
                result.instance = instance;
                result.message = "Account " + username + " added";
            }
        }

        if (result.ok) {
            LOG_INFO << "Added instance: " << username << " (" << instanceId << ") region=" << region;
        } else if (started.ok) {
            proxy->Stop();
            result.failure = AddFailure::kStartFailed;
            result.message = "Failed to add account: pool shut down";
        } else {
            result.failure = started.reason == worker::StartError::kTwoFactorRequired
                                 ? AddFailure::kTwoFactorRequired
                                 : AddFailure::kStartFailed;
            result.message = "Failed to add account: " + started.message;
            LOG_ERROR << "Failed to add instance " << username << ": " << started.message;
        }
        cb(result);
    });
}

bool InstancePool::Remove(const std::string& instanceId, std::string* message) {
    InstancePtr instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(instanceId);
        if (it == instances_.end()) {
            if (message) *message = "Instance not found";
            return false;
        }
        instance = it->second;
        instances_.erase(it);
        auto nameIt = usernameToId_.find(instance->username);
        if (nameIt != usernameToId_.end() && nameIt->second == instanceId) usernameToId_.erase(nameIt);
    }

    if (instance->proxy) instance->proxy->Stop();
    instance->status = InstanceStatus::kStopped;
    LOG_INFO << "Removed instance: " << instance->username << " (" << instanceId << ")";
    if (message) *message = "Account " + instance->username + " removed";
    return true;
}

InstancePtr InstancePool::Get(const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instanceId);
    return it == instances_.end() ? nullptr : it->second;
}

InstancePtr InstancePool::GetByUsername(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto nameIt = usernameToId_.find(username);
    if (nameIt == usernameToId_.end()) return nullptr;
    auto it = instances_.find(nameIt->second);
    return it == instances_.end() ? nullptr : it->second;
}

std::vector<InstancePtr> InstancePool::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstancePtr> out;
    out.reserve(instances_.size());
    for (const auto& kv : instances_) out.push_back(kv.second);
    return out;
}

std::set<std::string> InstancePool::Regions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> regions;
    for (const auto& kv : instances_) {
        if (kv.second->IsActive()) regions.insert(kv.second->region);
    }
    return regions;
}

int InstancePool::ClientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto& kv : instances_) {
        if (kv.second->IsActive()) ++n;
    }
    return n;
}

size_t InstancePool::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

void InstancePool::HealthCheckAll(double timeoutSec, HealthMapCallback cb) {
    struct Fanout {
        std::map<std::string, bool> results;
        size_t remaining{0};
        HealthMapCallback cb;
    };

    auto instances = List();
    if (instances.empty()) {
        loop_->QueueInLoop([cb]() { cb({}); });
        return;
    }

    auto fanout = std::make_shared<Fanout>();
    fanout->remaining = instances.size();
    fanout->cb = std::move(cb);

    auto record = [fanout](const std::string& id, bool healthy) {
        fanout->results[id] = healthy;
        if (--fanout->remaining == 0) fanout->cb(std::move(fanout->results));
    };

    for (const auto& inst : instances) {
        const std::string id = inst->instanceId;
        if (!inst->proxy) {
            loop_->QueueInLoop([record, id]() { record(id, false); });
            continue;
        }
        inst->proxy->HealthCheck(timeoutSec, [record, id](const worker::ProbeResult& probe) {
            if (!probe.healthy) LOG_DEBUG << "Health check failed for " << id << ": " << probe.error;
            record(id, probe.healthy);
        });
    }
}

int InstancePool::CleanupIdle(double maxIdleSec) {
    std::vector<std::string> idle;
    for (const auto& inst : List()) {
        if (!inst->noRestart && inst->IdleSeconds() > maxIdleSec) idle.push_back(inst->instanceId);
    }

    int removed = 0;
    for (const auto& id : idle) {
        LOG_INFO << "Cleaning up idle instance: " << id;
        if (Remove(id)) ++removed;
    }
    return removed;
}

void InstancePool::ShutdownAll() {
    std::map<std::string, InstancePtr> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        pending_.clear();
        instances.swap(instances_);
        usernameToId_.clear();
    }
    if (instances.empty()) return;

    LOG_INFO << "Shutting down " << instances.size() << " instances...";
    for (auto& kv : instances) {
        if (kv.second->proxy) kv.second->proxy->Stop();
        kv.second->status = InstanceStatus::kStopped;
    }
    LOG_INFO << "All instances shut down";
}

} // namespace balancer
} // namespace wrapmgr
