#include "wrapmgr/balancer/Dispatcher.h"
#include "wrapmgr/protocol/WorkerWire.h"
#include "wrapmgr/common/Logger.h"

namespace wrapmgr {
namespace balancer {

namespace {
const char* const kNoInstance = "no available instance";
}

std::optional<DecryptTask> DecryptTask::Make(std::string adamId,
                                             std::string key,
                                             std::string sample,
                                             int sampleIndex,
                                             std::string* error) {
    if (adamId.size() > protocol::wire::kMaxFieldLength) {
        if (error) *error = "adam_id exceeds 255 bytes";
        return std::nullopt;
    }
    if (key.size() > protocol::wire::kMaxFieldLength) {
        if (error) *error = "key exceeds 255 bytes";
        return std::nullopt;
    }
    DecryptTask task;
    task.adamId = std::move(adamId);
    task.key = std::move(key);
    task.sample = std::move(sample);
    task.sampleIndex = sampleIndex;
    return task;
}

struct Dispatcher::SingleChain {
    InstancePtr instance;
    std::string adamId;
    std::string key;
    std::vector<std::string> samples;
    std::vector<std::string> results;
    size_t next{0};
    BatchCallback cb;
};

Dispatcher::Dispatcher(InstancePool* pool)
    : pool_(pool),
      rng_(std::random_device{}()) {
}

Dispatcher::Dispatcher(InstancePool* pool, unsigned seed)
    : pool_(pool),
      rng_(seed) {
}

InstancePtr Dispatcher::SelectInstance(const std::string& adamId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<InstancePtr> active;
    for (auto& inst : pool_->List()) {
        if (inst->IsActive()) active.push_back(inst);
    }
    if (active.empty()) return nullptr;

    for (auto& inst : active) {
        if (inst->proxy->lastAdamId() == adamId) {
            LOG_DEBUG << "Reusing instance " << inst->instanceId << " for " << adamId << " (sticky)";
            return inst;
        }
    }

    std::vector<InstancePtr> idle;
    for (auto& inst : active) {
        if (inst->proxy->lastAdamId().empty()) idle.push_back(inst);
    }

    const std::vector<InstancePtr>& candidates = idle.empty() ? active : idle;
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    InstancePtr selected = candidates[pick(rng_)];
    selected->proxy->setLastAdamId(adamId);
    LOG_DEBUG << "Selected " << (idle.empty() ? "random" : "idle") << " instance "
              << selected->instanceId << " for " << adamId;
    return selected;
}

void Dispatcher::Dispatch(DecryptTask task, ResultCallback cb) {
    InstancePtr instance = SelectInstance(task.adamId);
    if (!instance) {
        LOG_ERROR << "No available wrapper instance";
        DecryptResult result;
        result.error = kNoInstance;
        cb(std::move(result));
        return;
    }

    instance->Touch();
    const std::string instanceId = instance->instanceId;
    const std::string adamId = task.adamId;
    const int sampleIndex = task.sampleIndex;
    instance->proxy->Decrypt(task.adamId, task.key, std::move(task.sample), task.sampleIndex,
                             [cb, instanceId, adamId, sampleIndex](worker::DecryptOutcome outcome) {
        if (outcome.ok) {
            LOG_DEBUG << "Decrypt success: " << adamId << "[" << sampleIndex << "] via " << instanceId;
        } else {
            LOG_WARN << "Decrypt failed: " << adamId << "[" << sampleIndex << "] via " << instanceId
                     << ": " << outcome.error;
        }
        DecryptResult result;
        result.success = outcome.ok;
        result.data = std::move(outcome.data);
        result.error = std::move(outcome.error);
        result.instanceId = instanceId;
        cb(std::move(result));
    });
}

void Dispatcher::DispatchBatch(const std::string& adamId,
                               const std::string& key,
                               std::vector<std::string> samples,
                               BatchCallback cb) {
    std::string error;
    if (!DecryptTask::Make(adamId, key, std::string(), 0, &error)) {
        BatchResult result;
        result.error = error;
        cb(std::move(result));
        return;
    }

    InstancePtr instance = SelectInstance(adamId);
    if (!instance) {
        LOG_ERROR << "No available wrapper instance";
        BatchResult result;
        result.error = kNoInstance;
        cb(std::move(result));
        return;
    }
    instance->Touch();

    if (instance->proxy->SupportsBatch()) {
        const std::string instanceId = instance->instanceId;
        instance->proxy->DecryptBatch(adamId, key, std::move(samples),
                                      [cb, instanceId](worker::BatchOutcome outcome) {
            BatchResult result;
            result.success = outcome.ok;
            result.data = std::move(outcome.data);
            result.error = std::move(outcome.error);
            result.instanceId = instanceId;
            cb(std::move(result));
        });
        return;
    }

    auto chain = std::make_shared<SingleChain>();
    chain->instance = instance;
    chain->adamId = adamId;
    chain->key = key;
    chain->samples = std::move(samples);
    chain->results.reserve(chain->samples.size());
    chain->cb = std::move(cb);
    ChainSingles(chain);
}

void Dispatcher::ChainSingles(std::shared_ptr<SingleChain> chain) {
    if (chain->next == chain->samples.size()) {
        BatchResult result;
        result.success = true;
        result.data = std::move(chain->results);
        result.instanceId = chain->instance->instanceId;
        chain->cb(std::move(result));
        return;
    }

    const int index = static_cast<int>(chain->next);
    chain->instance->proxy->Decrypt(chain->adamId, chain->key, std::move(chain->samples[chain->next]), index,
                                    [chain](worker::DecryptOutcome outcome) {
        if (!outcome.ok) {
            BatchResult result;
            result.error = std::move(outcome.error);
            result.instanceId = chain->instance->instanceId;
            chain->cb(std::move(result));
            return;
        }
        chain->results.push_back(std::move(outcome.data));
        ++chain->next;
        ChainSingles(chain);
    });
}

DispatcherStatistics Dispatcher::GetStatistics() const {
    DispatcherStatistics stats;
    for (const auto& inst : pool_->List()) {
        ++stats.totalInstances;
        if (!inst->IsActive()) continue;
        ++stats.activeInstances;
        if (inst->proxy->lastAdamId().empty()) ++stats.idleInstances;
        else ++stats.busyInstances;
    }
    return stats;
}

} // namespace balancer
} // namespace wrapmgr
