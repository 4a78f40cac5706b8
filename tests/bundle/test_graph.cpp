/// @file test_graph.cpp
/// @brief Tests for refcounted bundle dependency loading

#include <catch2/catch_test_macros.hpp>
#include <hoard/bundle/graph.hpp>

#include "../support/scripted_source.hpp"

#include <map>
#include <optional>

using namespace hoard_bundle;
using hoard_core::ErrorCode;
using hoard_test::ScriptedSource;

namespace {

struct GraphFixture {
    ScriptedSource source;
    std::map<std::string, std::vector<std::string>> deps;
    int provider_calls = 0;
    DependencyGraph graph{source, [this](const std::string& name) {
        ++provider_calls;
        auto it = deps.find(name);
        return it != deps.end() ? it->second : std::vector<std::string>{};
    }};

    explicit GraphFixture(bool sync = true)
        : source(sync) {}

    /// Declare a bundle with its direct dependencies
    void bundle(const std::string& name, std::vector<std::string> dependencies = {}) {
        source.add_bundle(name);
        deps[name] = std::move(dependencies);
    }
};

/// Captures the outcome of an async graph call
struct Outcome {
    std::optional<hoard_core::Result<void>> result;

    GraphCallback callback() {
        return [this](hoard_core::Result<void> r) { result.emplace(std::move(r)); };
    }

    [[nodiscard]] bool ok() const { return result.has_value() && result->is_ok(); }
    [[nodiscard]] bool failed() const { return result.has_value() && result->is_err(); }
};

} // anonymous namespace

// =============================================================================
// Synchronous Loading
// =============================================================================

TEST_CASE("DependencyGraph loads a chain depth-first", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B"});
    f.bundle("B", {"C"});
    f.bundle("C");

    REQUIRE(f.graph.load_sync("A").is_ok());

    REQUIRE(f.graph.ref_count("A") == 1);
    REQUIRE(f.graph.ref_count("B") == 1);
    REQUIRE(f.graph.ref_count("C") == 1);
    REQUIRE(f.graph.state("A") == NodeState::Ready);
    REQUIRE(f.graph.loaded_count() == 3);
    REQUIRE(f.source.open_count("C") == 1);

    f.graph.unload("A");

    REQUIRE(f.graph.ref_count("A") == 0);
    REQUIRE(f.graph.ref_count("B") == 0);
    REQUIRE(f.graph.ref_count("C") == 0);
    REQUIRE(f.graph.state("C") == NodeState::Unloaded);
    REQUIRE(f.graph.loaded_count() == 0);
    REQUIRE(f.source.close_count("A") == 1);
    REQUIRE(f.source.close_count("B") == 1);
    REQUIRE(f.source.close_count("C") == 1);
    REQUIRE(f.graph.stats().closes == 3);
}

TEST_CASE("DependencyGraph shares dependencies between bundles", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("level1", {"common"});
    f.bundle("level2", {"common"});
    f.bundle("common");

    REQUIRE(f.graph.load_sync("level1").is_ok());
    REQUIRE(f.graph.load_sync("level2").is_ok());
    REQUIRE(f.graph.ref_count("common") == 2);
    REQUIRE(f.source.open_count("common") == 1);

    f.graph.unload("level1");
    REQUIRE(f.graph.ref_count("common") == 1);
    REQUIRE(f.graph.is_ready("common"));
    REQUIRE(f.source.close_count("common") == 0);

    f.graph.unload("level2");
    REQUIRE_FALSE(f.graph.is_ready("common"));
    REQUIRE(f.source.close_count("common") == 1);
}

TEST_CASE("DependencyGraph load and unload pairs leave counts unchanged", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B", "C"});
    f.bundle("B", {"C"});
    f.bundle("C");

    REQUIRE(f.graph.load_sync("B").is_ok());
    auto before_b = f.graph.ref_count("B");
    auto before_c = f.graph.ref_count("C");

    for (int i = 0; i < 3; ++i) {
        REQUIRE(f.graph.load_sync("A").is_ok());
        f.graph.unload("A");
    }

    REQUIRE(f.graph.ref_count("B") == before_b);
    REQUIRE(f.graph.ref_count("C") == before_c);
    REQUIRE_FALSE(f.graph.is_ready("A"));
}

TEST_CASE("DependencyGraph unload edge cases", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B"});
    f.bundle("B");

    SECTION("unknown bundle is a no-op") {
        f.graph.unload("ghost");
        REQUIRE(f.graph.loaded_count() == 0);
    }

    SECTION("double unload does not underflow dependencies") {
        REQUIRE(f.graph.load_sync("B").is_ok());
        REQUIRE(f.graph.load_sync("A").is_ok());
        REQUIRE(f.graph.ref_count("B") == 2);

        f.graph.unload("A");
        f.graph.unload("A");
        REQUIRE(f.graph.ref_count("B") == 1);
        REQUIRE(f.graph.is_ready("B"));
    }
}

TEST_CASE("DependencyGraph rolls back a failed load", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B", "C"});
    f.bundle("B");
    f.bundle("C");
    f.source.fail_bundle("C");

    auto result = f.graph.load_sync("A");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::BackendFailure);
    REQUIRE(*result.error().get_context("required_by") == "A");

    REQUIRE(f.graph.loaded_count() == 0);
    REQUIRE(f.source.open_count("B") == 1);
    REQUIRE(f.source.close_count("B") == 1);
    REQUIRE(f.source.open_count("A") == 0);
    REQUIRE(f.graph.stats().failures == 1);
}

TEST_CASE("DependencyGraph detects cycles", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("a", {"b"});
    f.bundle("b", {"a"});

    auto result = f.graph.load_sync("a");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::ValidationError);
    REQUIRE(f.graph.loaded_count() == 0);

    Outcome outcome;
    f.graph.load_async("a", outcome.callback());
    REQUIRE(outcome.failed());
    REQUIRE(f.source.pending_count() == 0);
}

TEST_CASE("DependencyGraph caches dependency lists", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B"});
    f.bundle("B");

    REQUIRE(f.graph.load_sync("A").is_ok());
    int calls = f.provider_calls;
    f.graph.unload("A");
    REQUIRE(f.graph.load_sync("A").is_ok());

    REQUIRE(f.provider_calls == calls);
    REQUIRE(f.graph.dependencies("A") == std::vector<std::string>{"B"});
}

TEST_CASE("DependencyGraph on a source without sync opens", "[bundle][graph]") {
    GraphFixture f(false);
    f.bundle("A");

    auto result = f.graph.load_sync("A");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::NotSupported);
    REQUIRE(f.source.open_count("A") == 0);
}

// =============================================================================
// Pinning
// =============================================================================

TEST_CASE("DependencyGraph pinned bundle is never closed by unload", "[bundle][graph][pinned]") {
    GraphFixture f;
    f.bundle("shaders");
    f.bundle("ui_atlas", {"shaders"});

    f.graph.set_pinned("shaders");
    REQUIRE(f.graph.preload_pinned_sync().is_ok());

    REQUIRE(f.graph.is_ready("shaders"));
    REQUIRE(f.graph.ref_count("shaders") == 0);
    REQUIRE(f.graph.node("shaders")->pinned);

    REQUIRE(f.graph.load_sync("ui_atlas").is_ok());
    REQUIRE(f.graph.ref_count("shaders") == 1);

    f.graph.unload("ui_atlas");
    REQUIRE(f.graph.ref_count("shaders") == 0);
    REQUIRE(f.graph.state("shaders") == NodeState::Ready);
    REQUIRE(f.source.close_count("shaders") == 0);
    REQUIRE(f.source.open_count("shaders") == 1);

    SECTION("unloading the pinned bundle at zero is a no-op") {
        f.graph.unload("shaders");
        REQUIRE(f.graph.is_ready("shaders"));
    }

    SECTION("preloading again does nothing") {
        REQUIRE(f.graph.preload_pinned_sync().is_ok());
        REQUIRE(f.source.open_count("shaders") == 1);
        REQUIRE(f.graph.ref_count("shaders") == 0);
    }

    SECTION("clear closes the pinned bundle") {
        f.graph.clear();
        REQUIRE(f.source.close_count("shaders") == 1);
        REQUIRE(f.graph.loaded_count() == 0);
    }
}

TEST_CASE("DependencyGraph pinned bundle dependencies stay held", "[bundle][graph][pinned]") {
    GraphFixture f;
    f.bundle("materials", {"textures"});
    f.bundle("textures");

    f.graph.set_pinned("materials");
    REQUIRE(f.graph.preload_pinned_sync().is_ok());

    REQUIRE(f.graph.ref_count("materials") == 0);
    REQUIRE(f.graph.ref_count("textures") == 1);
    REQUIRE_FALSE(f.graph.node("textures")->pinned);
}

TEST_CASE("DependencyGraph re-pinning", "[bundle][graph][pinned]") {
    GraphFixture f;
    f.bundle("old");
    f.bundle("new");

    REQUIRE(f.graph.load_sync("old").is_ok());
    f.graph.set_pinned("old");
    REQUIRE(f.graph.node("old")->pinned);

    f.graph.set_pinned("new");
    REQUIRE(f.graph.pinned() == "new");
    REQUIRE(f.graph.is_pinned("new"));
    REQUIRE_FALSE(f.graph.node("old")->pinned);

    f.graph.unload("old");
    REQUIRE_FALSE(f.graph.is_ready("old"));
}

TEST_CASE("DependencyGraph preload_pinned_async", "[bundle][graph][pinned]") {
    GraphFixture f(false);
    f.bundle("shaders");
    f.graph.set_pinned("shaders");

    Outcome outcome;
    f.graph.preload_pinned_async(outcome.callback());
    REQUIRE_FALSE(outcome.result.has_value());
    REQUIRE(f.graph.state("shaders") == NodeState::Loading);

    REQUIRE(f.source.complete_open("shaders"));
    REQUIRE(outcome.ok());
    REQUIRE(f.graph.is_ready("shaders"));
    REQUIRE(f.graph.ref_count("shaders") == 0);
}

// =============================================================================
// Asynchronous Loading
// =============================================================================

TEST_CASE("DependencyGraph async chain", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("A", {"B"});
    f.bundle("B", {"C"});
    f.bundle("C");

    Outcome outcome;
    f.graph.load_async("A", outcome.callback());

    // Only the leaf opens first; parents wait for their dependencies
    REQUIRE(f.source.pending_count() == 1);
    REQUIRE(f.graph.is_loading("C"));
    REQUIRE_FALSE(f.graph.is_loading("A"));

    REQUIRE(f.source.complete_open("C"));
    REQUIRE(f.graph.is_loading("B"));
    REQUIRE(f.source.complete_open("B"));
    REQUIRE_FALSE(outcome.result.has_value());
    REQUIRE(f.source.complete_open("A"));

    REQUIRE(outcome.ok());
    REQUIRE(f.graph.ref_count("A") == 1);
    REQUIRE(f.graph.ref_count("B") == 1);
    REQUIRE(f.graph.ref_count("C") == 1);

    f.graph.unload("A");
    REQUIRE(f.graph.loaded_count() == 0);
}

TEST_CASE("DependencyGraph async dependencies open in parallel", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("hud", {"fonts", "icons"});
    f.bundle("fonts");
    f.bundle("icons");

    Outcome outcome;
    f.graph.load_async("hud", outcome.callback());
    REQUIRE(f.source.pending_count() == 2);

    REQUIRE(f.source.complete_open("icons"));
    REQUIRE(f.source.complete_open("fonts"));
    REQUIRE(f.source.complete_open("hud"));
    REQUIRE(outcome.ok());
}

TEST_CASE("DependencyGraph coalesces concurrent async opens", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("music");

    Outcome first;
    Outcome second;
    f.graph.load_async("music", first.callback());
    f.graph.load_async("music", second.callback());

    REQUIRE(f.source.open_count("music") == 1);
    REQUIRE(f.source.complete_open("music"));

    REQUIRE(first.ok());
    REQUIRE(second.ok());
    REQUIRE(f.graph.ref_count("music") == 2);
}

TEST_CASE("DependencyGraph async load of a ready bundle completes inline", "[bundle][graph][async]") {
    GraphFixture f;
    f.bundle("A");
    REQUIRE(f.graph.load_sync("A").is_ok());

    Outcome outcome;
    f.graph.load_async("A", outcome.callback());
    REQUIRE(outcome.ok());
    REQUIRE(f.graph.ref_count("A") == 2);
}

TEST_CASE("DependencyGraph sync load conflicts with an async open", "[bundle][graph][async]") {
    GraphFixture f;
    f.bundle("A", {"C"});
    f.bundle("C");

    // Hold async opens while keeping sync available
    Outcome outcome;
    f.graph.load_async("C", outcome.callback());
    REQUIRE(f.graph.is_loading("C"));

    SECTION("direct") {
        auto result = f.graph.load_sync("C");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ConcurrencyConflict);
        REQUIRE(f.graph.stats().conflicts == 1);
    }

    SECTION("through a dependency") {
        auto result = f.graph.load_sync("A");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ConcurrencyConflict);
        REQUIRE(f.source.open_count("A") == 0);
    }

    REQUIRE(f.source.complete_open("C"));
    REQUIRE(outcome.ok());
    REQUIRE(f.graph.ref_count("C") == 1);

    REQUIRE(f.graph.load_sync("C").is_ok());
    REQUIRE(f.graph.ref_count("C") == 2);
}

TEST_CASE("DependencyGraph async failure rolls back", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("A", {"B", "C"});
    f.bundle("B");
    f.bundle("C");
    f.source.fail_bundle("C");

    Outcome outcome;
    f.graph.load_async("A", outcome.callback());
    f.source.complete_all();

    REQUIRE(outcome.failed());
    REQUIRE(*outcome.result->error().get_context("required_by") == "A");
    REQUIRE(f.graph.loaded_count() == 0);
    REQUIRE(f.source.close_count("B") == 1);
    REQUIRE(f.source.open_count("A") == 0);
}

TEST_CASE("DependencyGraph clear drops pending opens", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("late");

    Outcome outcome;
    f.graph.load_async("late", outcome.callback());
    f.graph.clear();

    REQUIRE(f.source.complete_open("late"));
    REQUIRE_FALSE(outcome.result.has_value());
    REQUIRE(f.source.close_count("late") == 1);
    REQUIRE(f.graph.loaded_count() == 0);
}

TEST_CASE("DependencyGraph reports Unloading while the source closes", "[bundle][graph]") {
    GraphFixture f;
    f.bundle("A", {"B"});
    f.bundle("B");
    REQUIRE(f.graph.load_sync("A").is_ok());

    std::map<std::string, NodeState> seen;
    f.source.on_close([&f, &seen](const std::string& name) { seen[name] = f.graph.state(name); });
    f.graph.unload("A");

    REQUIRE(seen.size() == 2);
    REQUIRE(seen["A"] == NodeState::Unloading);
    REQUIRE(seen["B"] == NodeState::Unloading);
    REQUIRE(f.graph.state("A") == NodeState::Unloaded);
    REQUIRE(f.graph.state("B") == NodeState::Unloaded);
}

TEST_CASE("DependencyGraph abandon_pending fails waiting loads", "[bundle][graph][async]") {
    GraphFixture f(false);
    f.bundle("A", {"B", "C"});
    f.bundle("B");
    f.bundle("C");

    Outcome outcome;
    f.graph.load_async("A", outcome.callback());
    REQUIRE(f.source.complete_open("B"));
    REQUIRE_FALSE(outcome.result.has_value());

    f.graph.abandon_pending(hoard_core::Error(ErrorCode::InvalidState, "shutting down"));

    REQUIRE(outcome.failed());
    REQUIRE(outcome.result->error().code() == ErrorCode::InvalidState);
    REQUIRE(f.source.close_count("B") == 1);
    REQUIRE(f.graph.ref_count("B") == 0);
    REQUIRE(f.graph.loaded_count() == 0);
    REQUIRE(f.graph.stats().abandoned == 1);

    SECTION("the late open is closed") {
        REQUIRE(f.source.complete_open("C"));
        REQUIRE(f.source.close_count("C") == 1);
        REQUIRE_FALSE(f.source.is_open("C"));
        REQUIRE(f.graph.loaded_count() == 0);
    }

    SECTION("a newer open is not settled by the abandoned one") {
        Outcome fresh;
        f.graph.load_async("C", fresh.callback());
        REQUIRE(f.source.pending_count() == 2);

        REQUIRE(f.source.complete_open("C"));
        REQUIRE_FALSE(fresh.result.has_value());
        REQUIRE(f.source.close_count("C") == 1);

        REQUIRE(f.source.complete_open("C"));
        REQUIRE(fresh.ok());
        REQUIRE(f.graph.ref_count("C") == 1);
        REQUIRE(f.source.is_open("C"));
    }
}
