// Platform listing, tree walk and substring search.
#include "TestSupport.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RemoteSearch.hpp"

using rftest::TestContext;
using romfetch::MockSftpClient;
using romfetch::NotificationBus;

namespace {

void buildPs1(MockSftpClient &c) {
    c.addFile("/roms/ps1/a.bin", "aaaa");
    c.addDirectory("/roms/ps1/sub");
    c.addFile("/roms/ps1/sub/b.iso", "bbbb");
    c.addFile("/roms/ps1/sub/B2.bin", "b2b2");
}

void test_join(TestContext &t) {
    t.check(romfetch::joinRemotePath("/roms", "ps1") == "/roms/ps1", "plain join");
    t.check(romfetch::joinRemotePath("/roms/", "ps1") == "/roms/ps1",
            "no doubled slash");
    t.check(romfetch::joinRemotePath("", "x") == "/x", "empty base is root");
}

void test_list_platforms(TestContext &t) {
    MockSftpClient c;
    c.addDirectory("/roms/snes");
    c.addFile("/roms/readme.txt", "hi");
    c.addDirectory("/roms/ps1");
    c.addSymlink("/roms/latest", "/roms/ps1");
    t.check(rftest::connectMock(c), "connect");

    NotificationBus bus;
    std::vector<std::string> out;
    std::string err;
    t.check(romfetch::listPlatforms(c, "/roms", out, err, &bus),
            "listing platforms succeeds");
    t.check(out == std::vector<std::string>({"snes", "ps1"}),
            "only real directories, in server order");
    t.check(bus.size() == 0, "nothing published on success");
}

void test_list_platforms_failure(TestContext &t) {
    MockSftpClient c;
    c.failListing("/roms");
    t.check(rftest::connectMock(c), "connect");
    NotificationBus bus;
    std::vector<std::string> out{"stale"};
    std::string err;
    t.check(!romfetch::listPlatforms(c, "/roms", out, err, &bus),
            "failure is reported");
    t.check(out.empty(), "output cleared on failure");
    const auto snap = bus.snapshot();
    t.check(snap.size() == 1 && snap[0].message ==
                                    "Could not list /roms: Permission denied",
            "failure notification text");
}

void test_search_case_insensitive(TestContext &t) {
    MockSftpClient c;
    buildPs1(c);
    t.check(rftest::connectMock(c), "connect");
    const auto hits = romfetch::searchRemote(c, "/roms/ps1", "b");
    t.check(hits == std::vector<std::string>({"/roms/ps1/a.bin",
                                              "/roms/ps1/sub/b.iso",
                                              "/roms/ps1/sub/B2.bin"}),
            "all names containing b, any case, in walk order");

    const auto iso = romfetch::searchRemote(c, "/roms/ps1", "  ISO ");
    t.check(iso == std::vector<std::string>({"/roms/ps1/sub/b.iso"}),
            "query is trimmed and lower-cased");
}

void test_blank_query_and_zero_limit(TestContext &t) {
    MockSftpClient c;
    buildPs1(c);
    t.check(rftest::connectMock(c), "connect");
    t.check(romfetch::searchRemote(c, "/roms/ps1", "   ").empty(),
            "blank query returns nothing");
    t.check(c.listCalls("/roms/ps1") == 0, "blank query does not walk");
    t.check(romfetch::searchRemote(c, "/roms/ps1", "b", 0).empty(),
            "zero limit returns nothing");
}

void test_limit_stops_walk(TestContext &t) {
    MockSftpClient c;
    buildPs1(c);
    c.addDirectory("/roms/ps1/zz");
    t.check(rftest::connectMock(c), "connect");
    const auto hits = romfetch::searchRemote(c, "/roms/ps1", "b", 2);
    t.check(hits.size() == 2, "search stops at the limit");
    t.check(c.listCalls("/roms/ps1/zz") == 0,
            "directories after the limit are not listed");
}

void test_symlink_cycle_terminates(TestContext &t) {
    MockSftpClient c;
    buildPs1(c);
    c.addSymlink("/roms/ps1/sub/loop", "/roms/ps1");
    t.check(rftest::connectMock(c), "connect");
    const auto hits = romfetch::searchRemote(c, "/roms/ps1", "loop");
    t.check(hits.empty(), "symlinks are never reported as files");
    t.check(c.listCalls("/roms/ps1") == 1, "root listed exactly once");
    t.check(c.listCalls("/roms/ps1/sub") == 1, "subdir listed exactly once");
}

void test_unreadable_subdir_continues(TestContext &t) {
    MockSftpClient c;
    c.addDirectory("/roms/gba/locked");
    c.addFile("/roms/gba/locked/hidden.gba", "x");
    c.addFile("/roms/gba/open/pokemon.gba", "x");
    c.failListing("/roms/gba/locked");
    t.check(rftest::connectMock(c), "connect");

    NotificationBus bus;
    romfetch::RemoteWalker walker(c, "/roms/gba", &bus);
    romfetch::WalkEntry e;
    std::vector<std::string> dirs;
    while (walker.next(e))
        dirs.push_back(e.dir);
    t.check(dirs == std::vector<std::string>({"/roms/gba", "/roms/gba/open"}),
            "walk continues past the unreadable sibling");
    t.check(walker.failedDirectories() == 1, "one failed directory counted");
    const auto snap = bus.snapshot();
    t.check(snap.size() == 1, "one notification for the unreadable directory");
    if (!snap.empty())
        t.checkContains(snap[0].message, "Cannot access /roms/gba/locked",
                        "notification names the directory");

    const auto hits = romfetch::searchRemote(c, "/roms/gba", ".gba");
    t.check(hits == std::vector<std::string>({"/roms/gba/open/pokemon.gba"}),
            "search still finds files in readable siblings");
}

void test_walk_entry_contents(TestContext &t) {
    MockSftpClient c;
    buildPs1(c);
    t.check(rftest::connectMock(c), "connect");
    romfetch::RemoteWalker walker(c, "/roms/ps1/");
    romfetch::WalkEntry e;
    t.check(walker.next(e), "first entry");
    t.check(e.dir == "/roms/ps1", "trailing slash dropped from top");
    t.check(e.subdirs == std::vector<std::string>({"sub"}), "subdirs split out");
    t.check(e.files == std::vector<std::string>({"a.bin"}), "files split out");
    t.check(walker.next(e) && e.dir == "/roms/ps1/sub", "pre-order descent");
    t.check(!walker.next(e), "tree exhausted");
}

} // namespace

int main() {
    TestContext t;
    test_join(t);
    test_list_platforms(t);
    test_list_platforms_failure(t);
    test_search_case_insensitive(t);
    test_blank_query_and_zero_limit(t);
    test_limit_stops_walk(t);
    test_symlink_cycle_terminates(t);
    test_unreadable_subdir_continues(t);
    test_walk_entry_contents(t);
    return t.finish("remote_search_tests");
}
