#include <doctest/doctest.h>
#include <qapp/platform.hpp>

#include "test_helpers.hpp"

#include <sys/stat.h>

using namespace qapp;
using qapp::test::TempTestDir;

TEST_CASE("atomic write creates parents and sets the mode") {
    TempTestDir tmp;
    auto path = tmp.file("a/b/c.txt");

    auto r = atomic_write_file(path, "content", 0640);
    REQUIRE(r.ok);
    CHECK(read_file(path).value_or("") == "content");

    struct stat st{};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0640);

    // No temp files left behind
    CHECK(list_directory(tmp.file("a/b")) == std::vector<std::string>{"c.txt"});
}

TEST_CASE("atomic write replaces existing content") {
    TempTestDir tmp;
    tmp.write("f", "old content that is longer");
    REQUIRE(atomic_write_file(tmp.file("f"), "new").ok);
    CHECK(read_file(tmp.file("f")).value_or("") == "new");
}

TEST_CASE("removing a missing file is not an error") {
    TempTestDir tmp;
    CHECK(atomic_remove_file(tmp.file("nothing")).ok);

    tmp.write("f", "x");
    CHECK(atomic_remove_file(tmp.file("f")).ok);
    CHECK_FALSE(path_exists(tmp.file("f")));
}

TEST_CASE("path helpers") {
    CHECK(join_path("/a", "b") == "/a/b");
    CHECK(join_path("/a/", "b") == "/a/b");
    CHECK(join_path("", "b") == "b");
    CHECK(get_parent_directory("/a/b/c") == "/a/b");
    CHECK(get_filename("/a/b/c.txt") == "c.txt");
}

TEST_CASE("file lock is exclusive per path") {
    TempTestDir tmp;
    std::string error;

    auto lock = FileLock::acquire(tmp.file("locks/app.lock"), error);
    REQUIRE(lock.has_value());
    CHECK(lock->held());
    CHECK(path_exists(tmp.file("locks/app.lock")));

    // Another process cannot take it while held
    auto probe = run_process({"flock", "-n", tmp.file("locks/app.lock"), "true"},
                             std::chrono::seconds(10));
    if (probe.ok && probe.exit_code != 127) {
        CHECK(probe.exit_code != 0);
    }

    lock->release();
    CHECK_FALSE(lock->held());

    auto again = FileLock::acquire(tmp.file("locks/app.lock"), error);
    CHECK(again.has_value());
}

TEST_CASE("run_process captures output and exit code") {
    auto r = run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 4"}, std::chrono::seconds(10));
    REQUIRE(r.ok);
    CHECK_FALSE(r.timed_out);
    CHECK(r.exit_code == 4);
    CHECK(r.output == "out\n");
    CHECK(r.error_output == "err\n");
}

TEST_CASE("run_process kills a process past its timeout") {
    auto r = run_process({"/bin/sh", "-c", "sleep 30"}, std::chrono::seconds(1));
    CHECK(r.timed_out);
}

TEST_CASE("run_process reports a missing executable") {
    auto r = run_process({"/nonexistent/qapp-binary"}, std::chrono::seconds(5));
    CHECK((!r.ok || r.exit_code == 127));
}

TEST_CASE("empty directories are pruned below the stop directory") {
    TempTestDir tmp;
    tmp.mkdir("app/init/db/nested");
    tmp.write("app/config/web/site.conf", "x");

    auto removed = remove_empty_directories(tmp.file("app/init/db/nested"), tmp.file("app"));
    CHECK(removed == std::vector<std::string>{
        tmp.file("app/init/db/nested"), tmp.file("app/init/db"), tmp.file("app/init")});
    CHECK(is_directory(tmp.file("app")));
    CHECK(is_directory(tmp.file("app/config/web")));
}

TEST_CASE("pruning stops at the first non-empty directory") {
    TempTestDir tmp;
    tmp.mkdir("app/init/db");
    tmp.write("app/init/keep.sql", "x");

    auto removed = remove_empty_directories(tmp.file("app/init/db"), tmp.file("app"));
    CHECK(removed == std::vector<std::string>{tmp.file("app/init/db")});
    CHECK(path_exists(tmp.file("app/init/keep.sql")));
}

TEST_CASE("directories outside the stop directory are never pruned") {
    TempTestDir tmp;
    tmp.mkdir("units/empty");
    tmp.mkdir("app");

    CHECK(remove_empty_directories(tmp.file("units/empty"), tmp.file("app")).empty());
    CHECK(remove_empty_directories(tmp.file("app"), tmp.file("app")).empty());
    CHECK(remove_empty_directories(tmp.file("units/empty"), "").empty());
    CHECK(is_directory(tmp.file("units/empty")));
    CHECK(is_directory(tmp.file("app")));
}

TEST_CASE("scratch directories are unique and cleaned up") {
    std::string first_path;
    {
        TempTestDir a;
        TempTestDir b;
        CHECK(a.path != b.path);
        CHECK(is_directory(a.path));
        first_path = a.path;
    }
    CHECK_FALSE(path_exists(first_path));
}
