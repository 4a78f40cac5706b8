/// @file test_coordinator.cpp
/// @brief Tests for LoadCoordinator request coalescing

#include <catch2/catch_test_macros.hpp>
#include <hoard/res/backend.hpp>
#include <hoard/res/cache.hpp>
#include <hoard/res/coordinator.hpp>

#include "../support/scripted_backend.hpp"

#include <optional>
#include <vector>

using namespace hoard_res;
using hoard_core::ErrorCode;
using hoard_test::ScriptedBackend;

namespace {

struct CoordinatorFixture {
    BackendRegistry backends;
    ScriptedBackend* backend = nullptr;
    ResourceCache cache{backends};
    LoadCoordinator coordinator{cache, backends};

    explicit CoordinatorFixture(bool sync = true) {
        auto scripted = std::make_unique<ScriptedBackend>(BackendKind::File, sync);
        backend = scripted.get();
        REQUIRE(backends.register_backend(std::move(scripted)).is_ok());
    }
};

} // anonymous namespace

// =============================================================================
// Synchronous Loads
// =============================================================================

TEST_CASE("LoadCoordinator load_sync", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("config.json", "{}");
    ResourceKey key(BackendKind::File, "config.json");

    auto first = f.coordinator.load_sync(key);
    REQUIRE(first.is_ok());
    REQUIRE(first.value()->text() == "{}");
    REQUIRE(f.cache.ref_count(key) == 1);

    SECTION("cache hit adds a reference without fetching") {
        auto second = f.coordinator.load_sync(key);
        REQUIRE(second.is_ok());
        REQUIRE(second.value() == first.value());
        REQUIRE(f.cache.ref_count(key) == 2);
        REQUIRE(f.backend->fetch_count("config.json") == 1);
        REQUIRE(f.coordinator.stats().cache_hits == 1);
    }

    SECTION("missing resource") {
        auto missing = f.coordinator.load_sync(ResourceKey(BackendKind::File, "nope.json"));
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == ErrorCode::NotFound);
        REQUIRE_FALSE(f.cache.contains(ResourceKey(BackendKind::File, "nope.json")));
    }

    SECTION("backend failure is passed through") {
        f.backend->fail("broken.bin", ResError::backend_failure("broken.bin", "checksum"));
        auto broken = f.coordinator.load_sync(ResourceKey(BackendKind::File, "broken.bin"));
        REQUIRE(broken.is_err());
        REQUIRE(broken.error().code() == ErrorCode::BackendFailure);
        REQUIRE(f.coordinator.stats().failures == 1);
    }

    SECTION("no backend for the kind") {
        auto remote = f.coordinator.load_sync(ResourceKey(BackendKind::Remote, "pack"));
        REQUIRE(remote.is_err());
        REQUIRE(remote.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("LoadCoordinator load_sync on an async-only backend", "[res][coordinator]") {
    CoordinatorFixture f(false);
    f.backend->add("remote.pak", "pak");

    auto result = f.coordinator.load_sync(ResourceKey(BackendKind::File, "remote.pak"));
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::NotSupported);
    REQUIRE(f.backend->fetch_count("remote.pak") == 0);
}

// =============================================================================
// Asynchronous Loads
// =============================================================================

TEST_CASE("LoadCoordinator coalesces concurrent async loads", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("hero.model", "mesh");
    ResourceKey key(BackendKind::File, "hero.model");

    std::vector<LoadResult> results;
    auto on_done = [&results](LoadResult r) { results.push_back(std::move(r)); };

    RequestId a = f.coordinator.load_async(key, on_done);
    RequestId b = f.coordinator.load_async(key, on_done);
    RequestId c = f.coordinator.load_async(key, on_done);

    REQUIRE(a != b);
    REQUIRE(f.coordinator.is_in_flight(key));
    REQUIRE(f.coordinator.waiter_count(key) == 3);
    REQUIRE(f.coordinator.is_pending(a));
    REQUIRE(f.coordinator.is_pending(c));
    REQUIRE(f.backend->fetch_count("hero.model") == 1);
    REQUIRE(results.empty());

    REQUIRE(f.backend->complete("hero.model"));

    REQUIRE(results.size() == 3);
    for (const auto& r : results) {
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == results.front().value());
    }
    REQUIRE(f.cache.ref_count(key) == 3);
    REQUIRE_FALSE(f.coordinator.is_in_flight(key));
    REQUIRE_FALSE(f.coordinator.is_pending(b));
    REQUIRE(f.coordinator.stats().coalesced == 2);
    REQUIRE(f.backend->fetch_count("hero.model") == 1);
}

TEST_CASE("LoadCoordinator async failure reaches every waiter", "[res][coordinator]") {
    CoordinatorFixture f;
    ResourceKey key(BackendKind::File, "missing.tex");

    int failures = 0;
    auto on_done = [&failures](LoadResult r) {
        if (r.is_err() && r.error().code() == ErrorCode::NotFound) {
            ++failures;
        }
    };

    f.coordinator.load_async(key, on_done);
    f.coordinator.load_async(key, on_done);
    REQUIRE(f.backend->complete("missing.tex"));

    REQUIRE(failures == 2);
    REQUIRE_FALSE(f.cache.contains(key));
    REQUIRE_FALSE(f.coordinator.is_in_flight(key));

    SECTION("failures are not cached; the next load fetches again") {
        f.backend->add("missing.tex", "now present");
        auto retry = f.coordinator.load_sync(key);
        REQUIRE(retry.is_ok());
        REQUIRE(f.backend->fetch_count("missing.tex") == 2);
    }
}

TEST_CASE("LoadCoordinator async cache hit completes inline", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("font.ttf", "glyphs");
    ResourceKey key(BackendKind::File, "font.ttf");
    REQUIRE(f.coordinator.load_sync(key).is_ok());

    bool called = false;
    RequestId id = f.coordinator.load_async(key, [&called](LoadResult r) {
        called = r.is_ok();
    });

    REQUIRE(called);
    REQUIRE_FALSE(f.coordinator.is_pending(id));
    REQUIRE(f.cache.ref_count(key) == 2);
    REQUIRE(f.backend->fetch_count("font.ttf") == 1);
}

TEST_CASE("LoadCoordinator backend completing inline", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("inline.txt", "now").set_immediate(true);
    ResourceKey key(BackendKind::File, "inline.txt");

    bool called = false;
    f.coordinator.load_async(key, [&called](LoadResult r) { called = r.is_ok(); });

    REQUIRE(called);
    REQUIRE(f.cache.ref_count(key) == 1);
    REQUIRE_FALSE(f.coordinator.is_in_flight(key));
}

TEST_CASE("LoadCoordinator sync load conflicts with an in-flight async load", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("music.ogg", "pcm");
    ResourceKey key(BackendKind::File, "music.ogg");

    bool async_ok = false;
    f.coordinator.load_async(key, [&async_ok](LoadResult r) { async_ok = r.is_ok(); });

    auto sync = f.coordinator.load_sync(key);
    REQUIRE(sync.is_err());
    REQUIRE(sync.error().code() == ErrorCode::ConcurrencyConflict);
    REQUIRE(f.coordinator.stats().conflicts == 1);
    REQUIRE(f.coordinator.waiter_count(key) == 1);
    REQUIRE_FALSE(f.cache.contains(key));

    REQUIRE(f.backend->complete("music.ogg"));
    REQUIRE(async_ok);
    REQUIRE(f.cache.ref_count(key) == 1);

    SECTION("retry after settle succeeds from the cache") {
        auto retry = f.coordinator.load_sync(key);
        REQUIRE(retry.is_ok());
        REQUIRE(f.cache.ref_count(key) == 2);
        REQUIRE(f.backend->fetch_count("music.ogg") == 1);
    }
}

TEST_CASE("LoadCoordinator async load with no backend", "[res][coordinator]") {
    CoordinatorFixture f;

    bool failed = false;
    f.coordinator.load_async(ResourceKey(BackendKind::Archive, "x"), [&failed](LoadResult r) {
        failed = r.is_err();
    });

    REQUIRE(failed);
    REQUIRE(f.coordinator.in_flight_count() == 0);
}

// =============================================================================
// Invalidation
// =============================================================================

TEST_CASE("LoadCoordinator refetches an invalidated entry", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("hero.model", "v1");
    ResourceKey key(BackendKind::File, "hero.model");

    REQUIRE(f.coordinator.load_sync(key).is_ok());
    REQUIRE(f.cache.invalidate(key));
    REQUIRE(f.backend->release_count("hero.model") == 1);
    f.backend->add("hero.model", "v2");

    SECTION("sync") {
        auto reloaded = f.coordinator.load_sync(key);
        REQUIRE(reloaded.is_ok());
        REQUIRE(reloaded.value()->text() == "v2");
        REQUIRE(f.backend->fetch_count("hero.model") == 2);
        REQUIRE(f.cache.get(key)->is_ready());
        REQUIRE(f.cache.ref_count(key) == 2);
        REQUIRE(f.coordinator.stats().refreshes == 1);
        REQUIRE(f.coordinator.stats().cache_hits == 0);
    }

    SECTION("async") {
        std::optional<LoadResult> result;
        f.coordinator.load_async(key, [&result](LoadResult r) { result.emplace(std::move(r)); });
        REQUIRE_FALSE(result.has_value());
        REQUIRE(f.cache.get(key)->state == EntryState::Loading);

        SECTION("success makes the entry ready again") {
            REQUIRE(f.backend->complete("hero.model"));
            REQUIRE(result->is_ok());
            REQUIRE(result->value()->text() == "v2");
            REQUIRE(f.cache.get(key)->is_ready());
            REQUIRE(f.cache.ref_count(key) == 2);
        }

        SECTION("failure leaves the entry invalid") {
            f.backend->fail("hero.model", ResError::backend_failure("hero.model", "disk error"));
            REQUIRE(f.backend->complete("hero.model"));
            REQUIRE(result->is_err());
            REQUIRE(f.cache.get(key)->state == EntryState::Invalid);
            REQUIRE(f.cache.ref_count(key) == 1);
        }
    }
}

// =============================================================================
// Abandoning
// =============================================================================

TEST_CASE("LoadCoordinator abandon_all settles every waiter", "[res][coordinator]") {
    CoordinatorFixture f;
    f.backend->add("a.txt", "a");
    ResourceKey key(BackendKind::File, "a.txt");

    std::vector<LoadResult> results;
    auto collect = [&results](LoadResult r) { results.push_back(std::move(r)); };
    RequestId first = f.coordinator.load_async(key, collect);
    RequestId second = f.coordinator.load_async(key, collect);

    REQUIRE(f.coordinator.abandon_all(ResError::abandoned()) == 1);
    REQUIRE(results.size() == 2);
    for (const auto& result : results) {
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidState);
    }
    REQUIRE_FALSE(f.coordinator.is_in_flight(key));
    REQUIRE_FALSE(f.coordinator.is_pending(first));
    REQUIRE_FALSE(f.coordinator.is_pending(second));

    SECTION("the fetch finishing later is released, not cached") {
        REQUIRE(f.backend->complete("a.txt"));
        REQUIRE(results.size() == 2);
        REQUIRE_FALSE(f.cache.contains(key));
        REQUIRE(f.backend->release_count("a.txt") == 1);
        REQUIRE(f.coordinator.stats().late_completions == 1);
    }

    SECTION("a newer fetch for the key is not settled by the older one") {
        std::optional<LoadResult> fresh;
        f.coordinator.load_async(key, [&fresh](LoadResult r) { fresh.emplace(std::move(r)); });
        REQUIRE(f.backend->pending_count() == 2);

        REQUIRE(f.backend->complete("a.txt"));
        REQUIRE_FALSE(fresh.has_value());
        REQUIRE(f.coordinator.is_in_flight(key));

        REQUIRE(f.backend->complete("a.txt"));
        REQUIRE(fresh.has_value());
        REQUIRE(fresh->is_ok());
        REQUIRE(f.cache.ref_count(key) == 1);
    }
}
