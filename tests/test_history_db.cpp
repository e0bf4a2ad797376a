#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

// Holds the database and its WAL side files.
struct TmpDb {
    std::string dir;
    std::string path;

    TmpDb() {
        std::string tmpl = "/tmp/arandu_test_db_XXXXXX";
        dir = ::mkdtemp(tmpl.data());
        path = dir + "/history.db";
    }

    ~TmpDb() { std::filesystem::remove_all(dir); }
};

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenFailsWhenParentIsAFile") {
        TmpDb tmp;
        std::ofstream(tmp.dir + "/blocker") << "x";
        HistoryDb db;
        REQUIRE_FALSE(db.open(tmp.dir + "/blocker/history.db"));
        REQUIRE_FALSE(db.is_open());
    }

    SECTION("RecordAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.record("/home/u/notes.md"));

        auto entries = db.recent(5);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].path == "/home/u/notes.md");
        REQUIRE(entries[0].open_count == 1);
        REQUIRE(entries[0].last_opened > 0);
    }

    SECTION("NewestFirst") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.record("/a.md"));
        REQUIRE(db.record("/b.md"));
        REQUIRE(db.record("/c.md"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].path == "/c.md");
        REQUIRE(entries[1].path == "/b.md");
        REQUIRE(entries[2].path == "/a.md");

        REQUIRE(db.recent(2).size() == 2);
    }

    SECTION("ReopeningBumpsCountAndOrder") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.record("/a.md"));
        REQUIRE(db.record("/b.md"));
        REQUIRE(db.record("/a.md"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].path == "/a.md");
        REQUIRE(entries[0].open_count == 2);
        REQUIRE(entries[1].path == "/b.md");
        REQUIRE(entries[1].open_count == 1);
        REQUIRE(entries[0].last_opened > entries[1].last_opened);
    }

    SECTION("TrimmedToMaxEntries") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path, 3));

        for (int i = 0; i < 6; ++i) {
            REQUIRE(db.record("/f" + std::to_string(i) + ".md"));
        }

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].path == "/f5.md");
        REQUIRE(entries[2].path == "/f3.md");
    }

    SECTION("ZeroMaxEntriesKeepsNewest") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path, 0));

        REQUIRE(db.record("/a.md"));
        REQUIRE(db.record("/b.md"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].path == "/b.md");
    }

    SECTION("Remove") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.record("/a.md"));
        REQUIRE(db.record("/b.md"));
        REQUIRE(db.remove("/a.md"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].path == "/b.md");

        // Removing an unknown path is not an error.
        REQUIRE(db.remove("/never.md"));
    }

    SECTION("Clear") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.record("/a.md"));
        REQUIRE(db.record("/b.md"));
        REQUIRE(db.clear());
        REQUIRE(db.recent(10).empty());
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.record("/a.md"));
            REQUIRE(db.record("/b.md"));
        }

        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.record("/c.md"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].path == "/c.md");
        REQUIRE(entries[1].path == "/b.md");
    }

    SECTION("ClosedDbRefusesWork") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        db.close();
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.record("/a.md"));
        REQUIRE(db.recent(10).empty());
    }
}
