#pragma once

#include "ctxpack/core/config.hpp"
#include "ctxpack/core/result.hpp"
#include "ctxpack/memory/thread.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctxpack::memory {

using namespace ctxpack::core;
namespace fs = std::filesystem;

// Persistence contract for threads. Every call may fail with a
// recoverable error (lock timeout, backend failure).
class ThreadStore {
public:
    virtual ~ThreadStore() = default;

    // ThreadNotFound when absent
    virtual Result<AgentThread, Error> get(const ThreadId& id) const = 0;

    virtual Result<void, Error> save(const AgentThread& thread) = 0;

    // Removing an absent thread succeeds
    virtual Result<void, Error> remove(const ThreadId& id) = 0;

    virtual Result<std::vector<ThreadId>, Error> list() const = 0;

    // Most recently updated first
    virtual Result<std::vector<ThreadSummary>, Error> list_summary() const = 0;
};

// Reader/writer lock with a bounded wait
class StoreLock {
public:
    using ReadGuard = std::shared_lock<std::shared_timed_mutex>;
    using WriteGuard = std::unique_lock<std::shared_timed_mutex>;

    explicit StoreLock(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    std::optional<ReadGuard> try_read() const;
    std::optional<WriteGuard> try_write() const;

    Error timeout_error(std::string_view operation, std::string_view id = {}) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    mutable std::shared_timed_mutex mutex_;
    std::chrono::milliseconds timeout_;
};

class InMemoryThreadStore : public ThreadStore {
public:
    explicit InMemoryThreadStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds{5000});

    Result<AgentThread, Error> get(const ThreadId& id) const override;
    Result<void, Error> save(const AgentThread& thread) override;
    Result<void, Error> remove(const ThreadId& id) override;
    Result<std::vector<ThreadId>, Error> list() const override;
    Result<std::vector<ThreadSummary>, Error> list_summary() const override;

    const StoreLock& lock() const { return lock_; }

private:
    StoreLock lock_;
    std::unordered_map<ThreadId, AgentThread> threads_;
};

// One pretty-printed {id}.json per thread, written atomically through a
// dot-prefixed temp file. Reads are cached.
class DiskThreadStore : public ThreadStore {
public:
    // Creates the directory if needed
    static Result<std::unique_ptr<DiskThreadStore>, Error> open(
        const fs::path& base_path,
        std::chrono::milliseconds lock_timeout = std::chrono::milliseconds{5000});

    Result<AgentThread, Error> get(const ThreadId& id) const override;
    Result<void, Error> save(const AgentThread& thread) override;
    Result<void, Error> remove(const ThreadId& id) override;
    Result<std::vector<ThreadId>, Error> list() const override;
    Result<std::vector<ThreadSummary>, Error> list_summary() const override;

    const fs::path& base_path() const { return base_path_; }
    fs::path thread_path(const ThreadId& id) const;

    // Replaces "..", '/', '\\' and NUL with '_'
    static std::string sanitize_id(std::string_view id);

    // Ids that map to their own file name unchanged and are not hidden.
    // save rejects any other id so list() and get() agree.
    static bool is_storable_id(std::string_view id);

    const StoreLock& lock() const { return lock_; }

    void clear_cache() const;

private:
    DiskThreadStore(fs::path base_path, std::chrono::milliseconds lock_timeout);

    fs::path base_path_;
    StoreLock lock_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<ThreadId, AgentThread> cache_;

    // Caller holds the store lock
    Result<AgentThread, Error> read_thread(const ThreadId& id) const;
    std::vector<ThreadId> scan_ids() const;
};

// Backend chosen by store.backend
Result<std::unique_ptr<ThreadStore>, Error> make_thread_store(const StoreConfig& config);

}  // namespace ctxpack::memory
