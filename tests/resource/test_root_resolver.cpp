// attest_resource resource root resolution tests

#include <catch2/catch_test_macros.hpp>
#include <attest/resource/root_resolver.hpp>

#include "../support/test_support.hpp"

using namespace attest_resource;
using attest_test::TempProject;

TEST_CASE("Root from project structure", "[resource][root]") {
    TempProject project("root");

    SECTION("Maven with compiled classes") {
        project.write("pom.xml", "<project/>");
        project.mkdir("target/classes/bpe");
        project.mkdir("src/main/resources/bpe");
        auto root = strategies::from_structure(project.path());
        REQUIRE(root.strategy == RootStrategy::MavenTargetClasses);
        REQUIRE(root.directory == project.path() / "target" / "classes");
    }

    SECTION("Maven before compilation") {
        project.write("pom.xml", "<project/>");
        project.mkdir("src/main/resources");
        auto root = strategies::from_structure(project.path());
        REQUIRE(root.strategy == RootStrategy::MavenSourceResources);
    }

    SECTION("Gradle with compiled resources") {
        project.write("build.gradle.kts", "");
        project.mkdir("build/resources/main");
        auto root = strategies::from_structure(project.path());
        REQUIRE(root.strategy == RootStrategy::GradleBuildResources);
    }

    SECTION("flat layout") {
        project.mkdir("fhir/ActivityDefinition");
        auto root = strategies::from_structure(project.path());
        REQUIRE(root.strategy == RootStrategy::FlatLayout);
        REQUIRE(root.directory == project.path());
        REQUIRE_FALSE(root.is_degraded());
    }

    SECTION("nothing recognizable degrades to the project directory") {
        project.write("README.md", "");
        auto root = strategies::from_structure(project.path());
        REQUIRE(root.is_degraded());
        REQUIRE(root.directory == project.path());
    }
}

TEST_CASE("Root from code source", "[resource][root]") {
    TempProject project("codesource");

    SECTION("Maven classes directory") {
        const auto classes = project.mkdir("target/classes");
        auto root = strategies::from_code_source(classes);
        REQUIRE(root);
        REQUIRE(root->strategy == RootStrategy::CodeSourceMaven);
        REQUIRE(root->directory == project.canonical("target/classes"));
    }

    SECTION("Gradle classes map to the resources directory") {
        const auto classes = project.mkdir("build/classes/java/main");
        project.mkdir("build/resources/main");
        auto root = strategies::from_code_source(classes);
        REQUIRE(root);
        REQUIRE(root->strategy == RootStrategy::CodeSourceGradle);
        REQUIRE(root->directory == project.canonical("build/resources/main"));
    }

    SECTION("archive code source yields nothing") {
        const auto jar = project.write("plugin.jar", "PK");
        REQUIRE_FALSE(strategies::from_code_source(jar).has_value());
    }
}

TEST_CASE("Root from package module", "[resource][root]") {
    TempProject project("module");
    project.mkdir("ping/target/classes");

    auto root = strategies::from_package_module(project.path(), "org.example.ping.PingProcessPluginDefinition");
    REQUIRE(root);
    REQUIRE(root->strategy == RootStrategy::PackageModuleMaven);
    REQUIRE(root->directory == project.path() / "ping" / "target" / "classes");

    REQUIRE_FALSE(strategies::from_package_module(project.path(), "org.example.pong.Def").has_value());
    REQUIRE_FALSE(strategies::from_package_module(project.path(), "Def").has_value());
}

TEST_CASE("ResourceRootResolver memoizes per project", "[resource][root]") {
    TempProject project("memo");
    project.write("pom.xml", "<project/>");
    project.mkdir("src/main/resources");

    ResourceRootResolver resolver;
    auto first = resolver.resolve_root(project.path());
    auto second = resolver.resolve_root(project.path() / "." );
    REQUIRE(first.directory == second.directory);
    REQUIRE(resolver.probe_count() == 1);

    // Later layout changes are not observed within a run
    project.mkdir("target/classes");
    REQUIRE(resolver.resolve_root(project.path()).strategy == RootStrategy::MavenSourceResources);

    resolver.clear();
    REQUIRE(resolver.resolve_root(project.path()).strategy == RootStrategy::MavenTargetClasses);
}

TEST_CASE("Shared and plugin-specific roots", "[resource][root]") {
    TempProject project("shared");
    project.write("pom.xml", "<project/>");
    const auto ping_classes = project.mkdir("ping/target/classes");
    const auto pong_classes = project.mkdir("pong/target/classes");

    RootHints ping{"ping", ping_classes, "org.example.ping.PingDefinition"};
    RootHints pong{"pong", pong_classes, "org.example.pong.PongDefinition"};

    ResourceRootResolver resolver;

    SECTION("first plugin wins for the shared root") {
        auto shared = resolver.resolve_shared_root(project.path(), {ping, pong});
        REQUIRE(shared.directory == project.canonical("ping/target/classes"));

        auto again = resolver.resolve_shared_root(project.path(), {pong, ping});
        REQUIRE(again.directory == shared.directory);
    }

    SECTION("plugin code source decides the plugin root") {
        (void)resolver.resolve_shared_root(project.path(), {ping, pong});
        auto root = resolver.resolve_root(project.path(), pong);
        REQUIRE(root.directory == project.canonical("pong/target/classes"));
    }

    SECTION("package module without code source") {
        RootHints hinted{"pong", std::nullopt, "org.example.pong.PongDefinition"};
        auto root = resolver.resolve_root(project.path(), hinted);
        REQUIRE(root.strategy == RootStrategy::PackageModuleMaven);
        REQUIRE(root.directory.filename() == "classes");
    }

    SECTION("no convention falls back to the parent of the shared root") {
        (void)resolver.resolve_shared_root(project.path(), {ping});
        const std::size_t probes = resolver.probe_count();
        RootHints bare{"other", std::nullopt, ""};
        auto root = resolver.resolve_root(project.path(), bare);
        REQUIRE(root.strategy == RootStrategy::SharedRootParent);
        REQUIRE(root.directory == project.canonical("ping/target"));
        // The memoized shared root is used; no project default is computed
        REQUIRE(resolver.probe_count() == probes + 1);
    }
}
