#include <catch2/catch_test_macros.hpp>
#include "ctxpack/memory/thread_store.hpp"
#include "test_helpers.hpp"

#include <future>
#include <thread>

using namespace ctxpack::memory;
using namespace ctxpack::context;
using namespace ctxpack::core;
using ctxpack::testing::TempDir;

namespace {

AgentThread make_thread(const std::string& title) {
    AgentThread thread("gpt-4o");
    thread.set_title(title);
    thread.add_segment(ContextSegment::chat({Message::user("hello " + title)}));
    return thread;
}

// Shared contract checks for every backend
void exercise_store(ThreadStore& store) {
    auto first = make_thread("first");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto second = make_thread("second");

    REQUIRE(store.save(first).is_ok());
    REQUIRE(store.save(second).is_ok());

    auto loaded = store.get(first.id());
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().title() == "first");
    REQUIRE(loaded.value().segments().size() == 1);

    auto ids = store.list();
    REQUIRE(ids.is_ok());
    REQUIRE(ids.value().size() == 2);

    auto summaries = store.list_summary();
    REQUIRE(summaries.is_ok());
    REQUIRE(summaries.value().size() == 2);
    REQUIRE(summaries.value()[0].id == second.id());
    REQUIRE(summaries.value()[0].segment_count == 1);
    REQUIRE(summaries.value()[1].title == "first");

    // Saving again replaces
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    first.set_title("renamed");
    REQUIRE(store.save(first).is_ok());
    REQUIRE(store.get(first.id()).value().title() == "renamed");
    REQUIRE(store.list_summary().value()[0].id == first.id());

    REQUIRE(store.remove(first.id()).is_ok());
    REQUIRE(store.get(first.id()).error().code == ErrorCode::ThreadNotFound);
    REQUIRE(store.remove(first.id()).is_ok());
    REQUIRE(store.list().value().size() == 1);
}

}  // namespace

TEST_CASE("In-memory store contract", "[store]") {
    InMemoryThreadStore store;
    exercise_store(store);
}

TEST_CASE("Disk store contract", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path() / "threads");
    REQUIRE(store.is_ok());
    exercise_store(*store.value());
}

TEST_CASE("Disk store persists across instances", "[store]") {
    TempDir dir;
    auto thread = make_thread("durable");
    thread.set_metadata("branch", "main");

    {
        auto store = DiskThreadStore::open(dir.path());
        REQUIRE(store.value()->save(thread).is_ok());
        REQUIRE(std::filesystem::exists(dir.path() / (thread.id() + ".json")));
    }

    auto reopened = DiskThreadStore::open(dir.path());
    auto loaded = reopened.value()->get(thread.id());
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().metadata_value("branch") == std::optional<std::string>("main"));
    REQUIRE(loaded.value().peek_sequence() == 1);
}

TEST_CASE("Disk store skips temp and foreign files", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path()).value();
    REQUIRE(store->save(make_thread("real")).is_ok());

    dir.write(".T-pending.tmp", "{}");
    dir.write(".hidden.json", "{}");
    dir.write("notes.txt", "hello");

    REQUIRE(store->list().value().size() == 1);
}

TEST_CASE("Disk store reports corrupted files", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path()).value();
    dir.write("T-broken.json", "{ not json");

    REQUIRE(store->get("T-broken").error().code == ErrorCode::ThreadCorrupted);

    // Listing summaries skips what it cannot read
    REQUIRE(store->save(make_thread("fine")).is_ok());
    REQUIRE(store->list_summary().value().size() == 1);
}

TEST_CASE("Thread ids are sanitized into file names", "[store]") {
    REQUIRE(DiskThreadStore::sanitize_id("../../etc/passwd") == "____etc_passwd");
    REQUIRE(DiskThreadStore::sanitize_id("a\\b") == "a_b");
    REQUIRE(DiskThreadStore::sanitize_id(std::string_view("a\0b", 3)) == "a_b");
    REQUIRE(DiskThreadStore::sanitize_id("T-123") == "T-123");

    TempDir dir;
    auto store = DiskThreadStore::open(dir.path()).value();
    REQUIRE(store->thread_path("../escape").parent_path() == dir.path());
}

TEST_CASE("Disk store only accepts ids that name their own file", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path()).value();

    REQUIRE(DiskThreadStore::is_storable_id("T-123"));
    REQUIRE_FALSE(DiskThreadStore::is_storable_id(""));
    REQUIRE_FALSE(DiskThreadStore::is_storable_id(".hidden"));
    REQUIRE_FALSE(DiskThreadStore::is_storable_id("a/b"));

    AgentThread traversal("../escape", "gpt-4o");
    REQUIRE(store->save(traversal).error().code == ErrorCode::InvalidArgument);
    AgentThread hidden(".quiet", "gpt-4o");
    REQUIRE(store->save(hidden).error().code == ErrorCode::InvalidArgument);

    // A stored "__escape" must not answer for "../escape"
    AgentThread plain("__escape", "gpt-4o");
    REQUIRE(store->save(plain).is_ok());
    REQUIRE(store->get("../escape").error().code == ErrorCode::ThreadNotFound);
    REQUIRE(store->remove("../escape").is_ok());

    auto ids = store->list().value();
    REQUIRE(ids == std::vector<ThreadId>{"__escape"});
    REQUIRE(store->get(ids.front()).value().id() == "__escape");
}

TEST_CASE("Disk store rejects a file whose stored id differs", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path()).value();

    AgentThread thread("T-original", "gpt-4o");
    dir.write("T-renamed.json", thread.to_json().dump());

    REQUIRE(store->get("T-renamed").error().code == ErrorCode::ThreadCorrupted);
    REQUIRE(store->list_summary().value().empty());
}

TEST_CASE("Failed save leaves the caller's thread untouched", "[store]") {
    TempDir dir;
    auto store = DiskThreadStore::open(dir.path() / "threads").value();
    auto thread = make_thread("kept");
    const Json before = thread.to_json();

    std::filesystem::remove_all(dir.path() / "threads");
    auto saved = store->save(thread);

    REQUIRE(saved.is_err());
    REQUIRE(thread.to_json() == before);
}

TEST_CASE("Lock contention surfaces as a timeout error", "[store]") {
    InMemoryThreadStore store(std::chrono::milliseconds(20));
    auto thread = make_thread("contended");
    REQUIRE(store.save(thread).is_ok());

    SECTION("writer blocks readers") {
        auto guard = store.lock().try_write();
        REQUIRE(guard.has_value());

        auto result = std::async(std::launch::async, [&]() { return store.get(thread.id()); }).get();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::StoreLockTimeout);
        REQUIRE(result.error().is_retriable());
    }

    SECTION("readers share, writers wait") {
        auto guard = store.lock().try_read();
        REQUIRE(guard.has_value());

        auto read = std::async(std::launch::async, [&]() { return store.get(thread.id()); }).get();
        REQUIRE(read.is_ok());

        auto write = std::async(std::launch::async, [&]() { return store.save(thread); }).get();
        REQUIRE(write.error().code == ErrorCode::StoreLockTimeout);
    }
}

TEST_CASE("Store factory honors the backend setting", "[store]") {
    TempDir dir;
    StoreConfig config;

    config.backend = "memory";
    auto memory = make_thread_store(config);
    REQUIRE(memory.is_ok());
    REQUIRE(dynamic_cast<InMemoryThreadStore*>(memory.value().get()) != nullptr);

    config.backend = "disk";
    config.threads_path = dir.path() / "t";
    auto disk = make_thread_store(config);
    REQUIRE(disk.is_ok());
    REQUIRE(std::filesystem::exists(dir.path() / "t"));

    config.backend = "cloud";
    REQUIRE(make_thread_store(config).error().code == ErrorCode::InvalidArgument);
}
