#pragma once

#include "wrapmgr/balancer/InstancePool.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace wrapmgr {
namespace balancer {

// Built only through Make(), which rejects fields the wire format cannot carry.
struct DecryptTask {
    std::string adamId;
    std::string key;
    std::string sample;
    int sampleIndex{0};

    static std::optional<DecryptTask> Make(std::string adamId,
                                           std::string key,
                                           std::string sample,
                                           int sampleIndex,
                                           std::string* error);
};

struct DecryptResult {
    bool success{false};
    std::string data;
    std::string error;
    std::optional<std::string> instanceId;
};

struct BatchResult {
    bool success{false};
    std::vector<std::string> data; // input order
    std::string error;
    std::optional<std::string> instanceId;
};

struct DispatcherStatistics {
    int totalInstances{0};
    int activeInstances{0};
    int idleInstances{0};
    int busyInstances{0};
};

// Picks the worker for each decrypt: the instance that last served the same
// adam_id, else a random idle one, else any active one.
class Dispatcher {
public:
    using ResultCallback = std::function<void(DecryptResult)>;
    using BatchCallback = std::function<void(BatchResult)>;

    explicit Dispatcher(InstancePool* pool);
    Dispatcher(InstancePool* pool, unsigned seed);

    InstancePtr SelectInstance(const std::string& adamId);

    // cb may run before Dispatch returns when no instance is available.
    void Dispatch(DecryptTask task, ResultCallback cb);
    void DispatchBatch(const std::string& adamId,
                       const std::string& key,
                       std::vector<std::string> samples,
                       BatchCallback cb);

    DispatcherStatistics GetStatistics() const;

private:
    struct SingleChain;
    static void ChainSingles(std::shared_ptr<SingleChain> chain);

    InstancePool* pool_;
    std::mutex mutex_;
    std::mt19937 rng_;
};

} // namespace balancer
} // namespace wrapmgr
