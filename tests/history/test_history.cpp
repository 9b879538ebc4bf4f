// forge_history HistoryJournal tests

#include <catch2/catch_test_macros.hpp>
#include <forge/history/history.hpp>

#include <string>
#include <vector>

using namespace forge_history;

TEST_CASE("HistoryJournal records committed captures in order", "[history]") {
    HistoryJournal journal;

    journal.begin_capture("Move Layer");
    journal.begin_structural_change();
    REQUIRE(journal.is_capturing());
    journal.commit_capture();

    journal.save_state("Filter: Invert");
    journal.finish_state();

    REQUIRE_FALSE(journal.is_capturing());
    REQUIRE(journal.labels() == std::vector<std::string>{"Move Layer", "Filter: Invert"});
    REQUIRE(journal.entries()[0].structural);
    REQUIRE_FALSE(journal.entries()[1].structural);
    REQUIRE(journal.entries()[0].state == CaptureState::Committed);
    REQUIRE(journal.entries()[0].sequence < journal.entries()[1].sequence);
}

TEST_CASE("HistoryJournal abort drops the open capture", "[history]") {
    HistoryJournal journal;

    journal.save_state("Filter: Blur");
    journal.abort_capture();
    REQUIRE(journal.size() == 0);
    REQUIRE(journal.aborted_count() == 1);

    // Aborting with nothing open is harmless
    journal.abort_capture();
    REQUIRE(journal.aborted_count() == 1);
}

TEST_CASE("HistoryJournal tolerates unbalanced brackets", "[history]") {
    HistoryJournal journal;

    SECTION("commit without open") {
        journal.commit_capture();
        REQUIRE(journal.size() == 0);
    }

    SECTION("nested open drops the outer capture") {
        journal.begin_capture("Outer");
        journal.begin_capture("Inner");
        journal.commit_capture();
        REQUIRE(journal.labels() == std::vector<std::string>{"Inner"});
        REQUIRE(journal.aborted_count() == 1);
    }

    SECTION("structural mark outside a capture") {
        journal.begin_structural_change();
        REQUIRE_FALSE(journal.is_capturing());
    }
}

TEST_CASE("HistoryJournal clear", "[history]") {
    HistoryJournal journal;
    journal.save_state("A");
    journal.finish_state();
    journal.save_state("B");

    journal.clear();
    REQUIRE(journal.size() == 0);
    REQUIRE_FALSE(journal.is_capturing());
}

TEST_CASE("capture_state_name", "[history]") {
    REQUIRE(std::string(capture_state_name(CaptureState::Open)) == "Open");
    REQUIRE(std::string(capture_state_name(CaptureState::Aborted)) == "Aborted");
}
