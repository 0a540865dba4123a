#include "ctxpack/memory/thread_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace ctxpack::memory {

namespace {

void sort_newest_first(std::vector<ThreadSummary>& summaries) {
    std::sort(summaries.begin(), summaries.end(), [](const ThreadSummary& a, const ThreadSummary& b) {
        if (a.updated_at != b.updated_at) {
            return a.updated_at > b.updated_at;
        }
        return a.id < b.id;
    });
}

}  // namespace

// StoreLock
std::optional<StoreLock::ReadGuard> StoreLock::try_read() const {
    ReadGuard guard(mutex_, std::defer_lock);
    if (!guard.try_lock_for(timeout_)) {
        return std::nullopt;
    }
    return std::optional<ReadGuard>(std::move(guard));
}

std::optional<StoreLock::WriteGuard> StoreLock::try_write() const {
    WriteGuard guard(mutex_, std::defer_lock);
    if (!guard.try_lock_for(timeout_)) {
        return std::nullopt;
    }
    return std::optional<WriteGuard>(std::move(guard));
}

Error StoreLock::timeout_error(std::string_view operation, std::string_view id) const {
    Error e{ErrorCode::StoreLockTimeout,
            "Timed out after " + std::to_string(timeout_.count()) + "ms waiting for store lock during " +
                std::string(operation)};
    if (!id.empty()) {
        e.context = std::string(id);
    }
    e.source = "thread_store";
    return e;
}

// InMemoryThreadStore
InMemoryThreadStore::InMemoryThreadStore(std::chrono::milliseconds lock_timeout)
    : lock_(lock_timeout)
{
}

Result<AgentThread, Error> InMemoryThreadStore::get(const ThreadId& id) const {
    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("get", id);
    }

    auto it = threads_.find(id);
    if (it == threads_.end()) {
        return Error::from_code(ErrorCode::ThreadNotFound, id);
    }
    return Result<AgentThread, Error>::ok(it->second);
}

Result<void, Error> InMemoryThreadStore::save(const AgentThread& thread) {
    auto guard = lock_.try_write();
    if (!guard) {
        return lock_.timeout_error("save", thread.id());
    }

    threads_.insert_or_assign(thread.id(), thread);
    return Result<void, Error>::ok();
}

Result<void, Error> InMemoryThreadStore::remove(const ThreadId& id) {
    auto guard = lock_.try_write();
    if (!guard) {
        return lock_.timeout_error("remove", id);
    }

    threads_.erase(id);
    return Result<void, Error>::ok();
}

Result<std::vector<ThreadId>, Error> InMemoryThreadStore::list() const {
    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("list");
    }

    std::vector<ThreadId> ids;
    ids.reserve(threads_.size());
    for (const auto& [id, _] : threads_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return Result<std::vector<ThreadId>, Error>::ok(std::move(ids));
}

Result<std::vector<ThreadSummary>, Error> InMemoryThreadStore::list_summary() const {
    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("list_summary");
    }

    std::vector<ThreadSummary> summaries;
    summaries.reserve(threads_.size());
    for (const auto& [_, thread] : threads_) {
        summaries.push_back(ThreadSummary::from_thread(thread));
    }
    sort_newest_first(summaries);
    return Result<std::vector<ThreadSummary>, Error>::ok(std::move(summaries));
}

// DiskThreadStore
DiskThreadStore::DiskThreadStore(fs::path base_path, std::chrono::milliseconds lock_timeout)
    : base_path_(std::move(base_path))
    , lock_(lock_timeout)
{
}

Result<std::unique_ptr<DiskThreadStore>, Error> DiskThreadStore::open(
    const fs::path& base_path,
    std::chrono::milliseconds lock_timeout)
{
    using R = Result<std::unique_ptr<DiskThreadStore>, Error>;

    std::error_code ec;
    fs::create_directories(base_path, ec);
    if (ec) {
        return R::err(ErrorCode::StoreBackendFailed,
                      "Failed to create threads directory: " + ec.message(),
                      base_path.string());
    }

    spdlog::debug("Thread store at {}", base_path.string());
    return R::ok(std::unique_ptr<DiskThreadStore>(new DiskThreadStore(base_path, lock_timeout)));
}

std::string DiskThreadStore::sanitize_id(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (size_t i = 0; i < id.size(); ++i) {
        if (id[i] == '.' && i + 1 < id.size() && id[i + 1] == '.') {
            out.push_back('_');
            ++i;
            continue;
        }
        const char c = id[i];
        out.push_back((c == '/' || c == '\\' || c == '\0') ? '_' : c);
    }
    return out;
}

bool DiskThreadStore::is_storable_id(std::string_view id) {
    return !id.empty() && id.front() != '.' && sanitize_id(id) == id;
}

fs::path DiskThreadStore::thread_path(const ThreadId& id) const {
    return base_path_ / (sanitize_id(id) + ".json");
}

void DiskThreadStore::clear_cache() const {
    std::lock_guard lock(cache_mutex_);
    cache_.clear();
}

Result<AgentThread, Error> DiskThreadStore::read_thread(const ThreadId& id) const {
    using R = Result<AgentThread, Error>;

    {
        std::lock_guard lock(cache_mutex_);
        auto it = cache_.find(id);
        if (it != cache_.end()) {
            return R::ok(it->second);
        }
    }

    const fs::path path = thread_path(id);
    if (!fs::exists(path)) {
        return Error::from_code(ErrorCode::ThreadNotFound, id);
    }

    std::ifstream file(path);
    if (!file) {
        return R::err(ErrorCode::FileReadFailed, "Failed to open thread file", path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Json j;
    try {
        j = Json::parse(buffer.str());
    } catch (const Json::parse_error& e) {
        return R::err(ErrorCode::ThreadCorrupted, e.what(), path.string());
    }

    auto thread = AgentThread::from_json(j);
    if (thread.is_err()) {
        return thread;
    }
    if (thread.value().id() != id) {
        return R::err(ErrorCode::ThreadCorrupted,
                      "Stored id '" + thread.value().id() + "' does not match its file",
                      path.string());
    }

    {
        std::lock_guard lock(cache_mutex_);
        cache_.insert_or_assign(id, thread.value());
    }
    return thread;
}

Result<AgentThread, Error> DiskThreadStore::get(const ThreadId& id) const {
    // Such an id can never have been saved
    if (!is_storable_id(id)) {
        return Error::from_code(ErrorCode::ThreadNotFound, id);
    }

    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("get", id);
    }
    return read_thread(id);
}

Result<void, Error> DiskThreadStore::save(const AgentThread& thread) {
    if (!is_storable_id(thread.id())) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument,
                                        "Thread id cannot be used as a file name",
                                        thread.id());
    }

    auto guard = lock_.try_write();
    if (!guard) {
        return lock_.timeout_error("save", thread.id());
    }

    const fs::path path = thread_path(thread.id());
    const fs::path temp_path = base_path_ / ("." + sanitize_id(thread.id()) + ".tmp");

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            return Result<void, Error>::err(ErrorCode::FileWriteFailed,
                                            "Failed to open temp file for writing",
                                            temp_path.string());
        }
        file << thread.to_json().dump(2);
        file.flush();
        if (!file) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return Result<void, Error>::err(ErrorCode::FileWriteFailed,
                                            "Failed to write thread",
                                            temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Result<void, Error>::err(ErrorCode::StoreBackendFailed,
                                        "Failed to move thread into place: " + ec.message(),
                                        path.string());
    }

    std::lock_guard lock(cache_mutex_);
    cache_.insert_or_assign(thread.id(), thread);
    return Result<void, Error>::ok();
}

Result<void, Error> DiskThreadStore::remove(const ThreadId& id) {
    if (!is_storable_id(id)) {
        return Result<void, Error>::ok();
    }

    auto guard = lock_.try_write();
    if (!guard) {
        return lock_.timeout_error("remove", id);
    }

    std::error_code ec;
    fs::remove(thread_path(id), ec);
    if (ec) {
        return Result<void, Error>::err(ErrorCode::StoreBackendFailed,
                                        "Failed to delete thread: " + ec.message(),
                                        id);
    }

    std::lock_guard lock(cache_mutex_);
    cache_.erase(id);
    return Result<void, Error>::ok();
}

std::vector<ThreadId> DiskThreadStore::scan_ids() const {
    std::vector<ThreadId> ids;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        const std::string name = entry.path().filename().string();
        // Temp files are dot-prefixed
        if (name.empty() || name.front() == '.' || entry.path().extension() != ".json") {
            continue;
        }
        ids.push_back(entry.path().stem().string());
    }
    if (ec) {
        spdlog::warn("Failed to scan {}: {}", base_path_.string(), ec.message());
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

Result<std::vector<ThreadId>, Error> DiskThreadStore::list() const {
    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("list");
    }
    return Result<std::vector<ThreadId>, Error>::ok(scan_ids());
}

Result<std::vector<ThreadSummary>, Error> DiskThreadStore::list_summary() const {
    auto guard = lock_.try_read();
    if (!guard) {
        return lock_.timeout_error("list_summary");
    }

    std::vector<ThreadSummary> summaries;
    for (const auto& id : scan_ids()) {
        auto thread = read_thread(id);
        if (thread.is_err()) {
            spdlog::warn("Skipping thread {}: {}", id, thread.error().full_message());
            continue;
        }
        summaries.push_back(ThreadSummary::from_thread(thread.value()));
    }

    sort_newest_first(summaries);
    return Result<std::vector<ThreadSummary>, Error>::ok(std::move(summaries));
}

Result<std::unique_ptr<ThreadStore>, Error> make_thread_store(const StoreConfig& config) {
    using R = Result<std::unique_ptr<ThreadStore>, Error>;
    const std::chrono::milliseconds timeout{config.lock_timeout_ms};

    if (config.backend == "memory") {
        return R::ok(std::make_unique<InMemoryThreadStore>(timeout));
    }

    if (config.backend == "disk") {
        auto store = DiskThreadStore::open(config.threads_path, timeout);
        if (store.is_err()) {
            return std::move(store).error();
        }
        return R::ok(std::move(store).value());
    }

    return R::err(ErrorCode::InvalidArgument, "Unknown store backend: " + config.backend);
}

}  // namespace ctxpack::memory
