// attest_resource ResourceLocator tests

#include <catch2/catch_test_macros.hpp>
#include <attest/resource/locator.hpp>
#include <attest/resource/archive.hpp>
#include <attest/resource/temp_files.hpp>
#include <attest/core/config.hpp>

#include "../support/test_support.hpp"

#include <fstream>
#include <iterator>

using namespace attest_resource;
using attest_test::TempProject;
using attest_test::ZipWriter;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Maven project with src/main/resources as its resource root
struct LocatorFixture {
    TempProject project{"locator"};
    attest_core::AttestConfig config;
    ArchiveCache archives;
    std::string prefix = attest_test::unique_prefix("locator");
    TempFileRegistry temp_files{prefix};
    ResourceRootResolver roots;

    LocatorFixture() {
        project.write("pom.xml", "<project/>");
        project.write("src/main/resources/fhir/ActivityDefinition/x.xml", "<ActivityDefinition/>");
        project.write("src/main/resources/bpmn/ping.bpmn", "<definitions/>");
        project.write("other/x.xml", "<Outside/>");
        ZipWriter()
            .add("fhir/ActivityDefinition/y.xml", "<FromJar/>")
            .add("fhir/ActivityDefinition/x.xml", "<Shadowed/>")
            .write(project.path() / "target/dependency/lib.jar");
    }

    ResourceRoot root() { return roots.resolve_root(project.path()); }
};

} // anonymous namespace

TEST_CASE_METHOD(LocatorFixture, "Locate classifications", "[resource][locator]") {
    ResourceLocator locator(config, archives, temp_files);
    const ResourceRoot r = root();
    REQUIRE(r.strategy == RootStrategy::MavenSourceResources);

    SECTION("file inside the root") {
        auto result = locator.locate("fhir/ActivityDefinition/x.xml", r);
        REQUIRE(is_in_root(result));
        REQUIRE(*file_of(result) == project.canonical("src/main/resources/fhir/ActivityDefinition/x.xml"));
    }

    SECTION("scheme and source prefixes resolve to the same file") {
        auto a = locator.locate("classpath:/fhir/ActivityDefinition/x.xml", r);
        auto b = locator.locate("src/main/resources/fhir/ActivityDefinition/x.xml", r);
        REQUIRE(is_in_root(a));
        REQUIRE(*file_of(a) == *file_of(b));
    }

    SECTION("well-known subfolder") {
        auto result = locator.locate("ping.bpmn", r);
        REQUIRE(is_in_root(result));
        REQUIRE(file_of(result)->filename() == "ping.bpmn");
    }

    SECTION("disk wins over a dependency archive") {
        auto result = locator.locate("fhir/ActivityDefinition/x.xml", r);
        REQUIRE(is_in_root(result));
        REQUIRE(read_file(*file_of(result)) == "<ActivityDefinition/>");
    }

    SECTION("dependency archive") {
        auto result = locator.locate("fhir/ActivityDefinition/y.xml", r);
        REQUIRE(is_from_dependency(result));
        const auto& hit = std::get<FoundInDependency>(result);
        REQUIRE(fs::exists(hit.materialized_file));
        REQUIRE(read_file(hit.materialized_file) == "<FromJar/>");
        REQUIRE(hit.origin_archive.filename() == "lib.jar");
        REQUIRE(hit.expected_root == r.directory);
        REQUIRE(*actual_location_of(result) == hit.origin_archive);
        REQUIRE(hit.materialized_file.string().find(prefix) != std::string::npos);
    }

    SECTION("relative traversal out of the root") {
        auto result = locator.locate("../../../other/x.xml", r);
        REQUIRE(is_outside_root(result));
        const auto& hit = std::get<FoundOutsideRoot>(result);
        REQUIRE(hit.actual_location == project.canonical("other/x.xml"));
        REQUIRE(hit.expected_root == r.directory);
    }

    SECTION("blank and unknown references") {
        REQUIRE(std::holds_alternative<NotFound>(locator.locate("", r)));
        REQUIRE(std::holds_alternative<NotFound>(locator.locate("  \t", r)));
        REQUIRE(std::holds_alternative<NotFound>(locator.locate("fhir/Task/absent.xml", r)));
    }
}

TEST_CASE_METHOD(LocatorFixture, "Symlink escaping the root is reported", "[resource][locator]") {
    std::error_code ec;
    fs::create_symlink(project.path() / "other" / "x.xml",
                       project.path() / "src/main/resources/fhir/link.xml", ec);
    if (ec) {
        SUCCEED("symlinks are not available here");
        return;
    }

    ResourceLocator locator(config, archives, temp_files);
    auto result = locator.locate("fhir/link.xml", root());
    REQUIRE(is_outside_root(result));
    REQUIRE(std::get<FoundOutsideRoot>(result).actual_location == project.canonical("other/x.xml"));
}

TEST_CASE_METHOD(LocatorFixture, "Dependency hits are materialized once", "[resource][locator]") {
    ResourceLocator locator(config, archives, temp_files);
    const ResourceRoot r = root();

    auto first = locator.locate("fhir/ActivityDefinition/y.xml", r);
    auto second = locator.locate("/fhir/ActivityDefinition/y.xml", r);
    REQUIRE(*file_of(first) == *file_of(second));
    REQUIRE(locator.materialization_count() == 1);
    REQUIRE(temp_files.tracked_count() == 1);

    SECTION("a released copy is extracted again") {
        temp_files.release(*file_of(first));
        REQUIRE_FALSE(fs::exists(*file_of(first)));

        auto third = locator.locate("fhir/ActivityDefinition/y.xml", r);
        REQUIRE(is_from_dependency(third));
        REQUIRE(fs::exists(*file_of(third)));
    }
}

TEST_CASE("Materialized files do not outlive cleanup", "[resource][locator]") {
    TempProject project("cleanup");
    project.mkdir("fhir");
    ZipWriter().add("fhir/Task/t.xml", "<Task/>").write(project.path() / "plugin.jar");

    attest_core::AttestConfig config;
    ArchiveCache archives;
    const std::string prefix = attest_test::unique_prefix("cleanup");
    fs::path materialized;
    {
        TempFileRegistry temp_files(prefix);
        ResourceLocator locator(config, archives, temp_files);
        ResourceRootResolver roots;

        auto result = locator.locate("fhir/Task/t.xml", roots.resolve_root(project.path()));
        REQUIRE(is_from_dependency(result));
        materialized = *file_of(result);
        REQUIRE(attest_test::count_temp_entries(prefix) == 1);
    }
    REQUIRE_FALSE(fs::exists(materialized));
    REQUIRE(attest_test::count_temp_entries(prefix) == 0);
}

TEST_CASE_METHOD(LocatorFixture, "Absolute references", "[resource][locator]") {
    const auto absolute = (project.path() / "src/main/resources/fhir/ActivityDefinition/x.xml").string();

    SECTION("rejected by default") {
        ResourceLocator locator(config, archives, temp_files);
        REQUIRE(std::holds_alternative<NotFound>(locator.locate(absolute, root())));
    }

    SECTION("classified by containment when accepted") {
        config.accept_absolute_references = true;
        ResourceLocator locator(config, archives, temp_files);
        REQUIRE(is_in_root(locator.locate(absolute, root())));
        REQUIRE(is_outside_root(locator.locate((project.path() / "other/x.xml").string(), root())));
    }
}

TEST_CASE_METHOD(LocatorFixture, "locate_all summarizes a batch", "[resource][locator]") {
    ResourceLocator locator(config, archives, temp_files);

    auto resolved = locator.locate_all({
        "fhir/ActivityDefinition/x.xml",
        "classpath:fhir/ActivityDefinition/x.xml",
        "fhir/ActivityDefinition/y.xml",
        "../../../other/x.xml",
        "fhir/absent.xml",
    }, root(), project.path());

    REQUIRE(resolved.valid_files.size() == 2);
    REQUIRE(resolved.from_dependencies.count("fhir/ActivityDefinition/y.xml") == 1);
    REQUIRE(resolved.outside_root.count("../../../other/x.xml") == 1);
    REQUIRE(resolved.missing_references == std::vector<std::string>{"fhir/absent.xml"});
    REQUIRE_FALSE(resolved.all_in_root());
}

TEST_CASE("Containment helpers", "[resource][locator]") {
    TempProject project("contain");
    project.write("root/a/b.txt");
    project.write("sibling/c.txt");

    REQUIRE(is_under_directory(project.path() / "root/a/b.txt", project.path() / "root"));
    REQUIRE(is_under_directory(project.path() / "root/../root/a/b.txt", project.path() / "root"));
    REQUIRE_FALSE(is_under_directory(project.path() / "root/../sibling/c.txt", project.path() / "root"));
    REQUIRE_FALSE(is_under_directory(project.path() / "root", project.path() / "root"));
    REQUIRE_FALSE(is_under_directory(project.path() / "rootless.txt", project.path() / "root"));

    project.write("maven/pom.xml", "<project/>");
    project.mkdir("maven/target/classes");
    REQUIRE(project_dir_for_root(project.path() / "maven/target/classes") == project.canonical("maven"));
    project.mkdir("gradle/build/resources/main");
    REQUIRE(project_dir_for_root(project.path() / "gradle/build/resources/main") == project.canonical("gradle"));
}

TEST_CASE("Enclosing projects do not lend their dependencies", "[resource][locator]") {
    TempProject project("enclosing");
    project.write("pom.xml", "<project/>");
    ZipWriter()
        .add("fhir/Task/task.xml", "<FromParent/>")
        .write(project.path() / "target/dependency/parent.jar");
    project.write("plugins/ping/fhir/ActivityDefinition/ping.xml", "<ActivityDefinition/>");
    project.mkdir("module/target/classes");

    REQUIRE(project_dir_for_root(project.path() / "plugins/ping") == project.canonical("plugins/ping"));
    REQUIRE(project_dir_for_root(project.path() / "module/target/classes") == project.canonical("module"));
    REQUIRE(project_dir_for_root(project.path()) == project.canonical());

    attest_core::AttestConfig config;
    ArchiveCache archives;
    TempFileRegistry temp_files{attest_test::unique_prefix("enclosing")};
    ResourceLocator locator(config, archives, temp_files);

    ResourceRoot nested;
    nested.directory = project.canonical("plugins/ping");
    nested.strategy = RootStrategy::ProjectRootFallback;

    REQUIRE(is_in_root(locator.locate("fhir/ActivityDefinition/ping.xml", nested)));
    REQUIRE(std::holds_alternative<NotFound>(locator.locate("fhir/Task/task.xml", nested)));
}
