#include <catch2/catch_test_macros.hpp>
#include "sync/host_adapter.hpp"
#include "sync/path_policy.hpp"

using namespace caretsync::sync;

TEST_CASE("Default syncable path heuristic", "[host]") {
    REQUIRE(is_default_syncable_path(QStringLiteral("/home/me/project/src/main.cpp")));
    REQUIRE(is_default_syncable_path(QStringLiteral("C:\\work\\app.ts")));

    REQUIRE_FALSE(is_default_syncable_path(QStringLiteral("extension-output-ms-python.python-#1")));
    REQUIRE_FALSE(is_default_syncable_path(QStringLiteral("/tmp/debug-console")));
    REQUIRE_FALSE(is_default_syncable_path(QStringLiteral("output:tasks")));
    REQUIRE_FALSE(is_default_syncable_path(QStringLiteral("extension:git")));
}

TEST_CASE("Path policy", "[host][path]") {
    const auto messy = QStringLiteral("/home/me/project/./src/../src/main.cpp");

    SECTION("Exact keeps the reported bytes") {
        REQUIRE(apply_path_policy(messy, PathPolicy::Exact) == messy);
    }

    SECTION("Clean resolves dot segments") {
        REQUIRE(apply_path_policy(messy, PathPolicy::Clean) ==
                QStringLiteral("/home/me/project/src/main.cpp"));
        REQUIRE(apply_path_policy(QStringLiteral("/a//b/"), PathPolicy::Clean) == QStringLiteral("/a/b"));
    }

    SECTION("Clean does not fold case") {
        REQUIRE(apply_path_policy(QStringLiteral("/A/b.cpp"), PathPolicy::Clean) == QStringLiteral("/A/b.cpp"));
    }
}
