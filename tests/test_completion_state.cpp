#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include "core/completion_state.hpp"
#include "test_runner.hpp"

using namespace ghost;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {
struct Tracker_Fixture {
    Test_Runner tr;
    Completion_Tracker tracker = {};

    Tracker_Fixture() {
        tracker.init(seconds(5));
        tracker.now = Test_Runner::now;
    }
    ~Tracker_Fixture() { tracker.drop(); }

    /// Install `completion` at the cursor of `input`.
    void install(cz::Str completion, cz::Str input) {
        Document_Snapshot snapshot = tr.snapshot(input);
        tracker.set_completion(completion, snapshot, snapshot.cursor);
    }
};
}

TEST_CASE("Completion_Tracker starts empty") {
    Tracker_Fixture f;
    CHECK_FALSE(f.tracker.has_active_completion());
    CHECK(f.tracker.has_conflict(f.tr.snapshot("abc|")));

    cz::Str out;
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("abc|"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::NONE);
}

TEST_CASE("Completion_Tracker interpolate when empty keeps the last withdraw reason") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = q|;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);

    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = |;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);
}

TEST_CASE("Completion_Tracker interpolate unchanged document") {
    Tracker_Fixture f;
    f.install("function", "x = |;");
    CHECK(f.tracker.has_active_completion());

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = |;"), &out));
    CHECK(out == "function");
    CHECK(f.tracker.has_active_completion());
}

TEST_CASE("Completion_Tracker interpolate strips typed prefix") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = f|;"), &out));
    CHECK(out == "unction");

    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = fun|;"), &out));
    CHECK(out == "ction");

    SECTION("backspace") {
        REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = fu|;"), &out));
        CHECK(out == "nction");
    }

    SECTION("typed everything") {
        REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = function|;"), &out));
        CHECK(out == "");
    }
}

TEST_CASE("Completion_Tracker interpolate at start of document") {
    Tracker_Fixture f;
    f.install("function", "|");

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("fun|"), &out));
    CHECK(out == "ction");
}

TEST_CASE("Completion_Tracker typing something else withdraws") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    CHECK(f.tracker.has_conflict(f.tr.snapshot("x = xyz|;")));
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = xyz|;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);
    CHECK_FALSE(f.tracker.has_active_completion());

    // Stays withdrawn even if the document goes back to matching.
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = fun|;"), &out));
}

TEST_CASE("Completion_Tracker diverging after matching withdraws") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = fu|;"), &out));
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = fux|;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);
}

TEST_CASE("Completion_Tracker deleting on an earlier line") {
    Tracker_Fixture f;
    f.install("foo", "abcd\nx|");

    cz::Str out;
    SECTION("unchanged") {
        REQUIRE(f.tracker.interpolate(f.tr.snapshot("abc\nx|"), &out));
        CHECK(out == "foo");
    }

    SECTION("then typing at the anchor") {
        // The text still matches but the old offset of the anchor is now the
        // cursor so the result would be drawn one character too late.
        CHECK_FALSE(f.tracker.has_conflict(f.tr.snapshot("abc\nxf|")));
        CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("abc\nxf|"), &out));
        CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);
        CHECK_FALSE(f.tracker.has_active_completion());
    }
}

TEST_CASE("Completion_Tracker other document withdraws") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    Document_Snapshot snapshot = f.tr.snapshot("x = |;", "other.cpp");
    CHECK(f.tracker.has_active_completion());
    CHECK_FALSE(f.tracker.is_valid_for_document(snapshot));
    CHECK_FALSE(f.tracker.interpolate(snapshot, &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::OTHER_DOCUMENT);
    CHECK_FALSE(f.tracker.has_active_completion());
}

TEST_CASE("Completion_Tracker stale suggestion withdraws") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::Str out;
    f.tr.advance(seconds(5));
    CHECK(f.tracker.is_valid_for_document(f.tr.snapshot("x = |;")));
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = fun|;"), &out));
    CHECK(out == "ction");

    f.tr.advance(milliseconds(1));
    CHECK_FALSE(f.tracker.is_valid_for_document(f.tr.snapshot("x = |;")));
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = fun|;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::STALE);
}

TEST_CASE("Completion_Tracker cursor leaving the range withdraws") {
    Tracker_Fixture f;
    f.install("function", "int x = |;\nint y;");

    cz::Str out;

    SECTION("before anchor") {
        CHECK(f.tracker.has_conflict(f.tr.snapshot("int x |= ;\nint y;")));
        CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("int x |= ;\nint y;"), &out));
    }

    SECTION("next line") {
        CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("int x = ;\nint |y;"), &out));
    }

    SECTION("deleted before anchor") {
        CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("int x =|;\nint y;"), &out));
    }

    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::CURSOR_LEFT_RANGE);
    CHECK_FALSE(f.tracker.has_active_completion());
}

TEST_CASE("Completion_Tracker cursor past typed text withdraws") {
    Tracker_Fixture f;
    f.install("fn", "x = |;;;");

    // The cursor is inside the range but what it skipped over isn't part of the suggestion.
    cz::Str out;
    CHECK_FALSE(f.tracker.interpolate(f.tr.snapshot("x = ;;|;"), &out));
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::TEXT_DIVERGED);
}

TEST_CASE("Completion_Tracker multiple line suggestion") {
    Tracker_Fixture f;
    f.install("{\n    return 0;\n}", "int main() |\n");

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("int main() {\n   |\n"), &out));
    CHECK(out == " return 0;\n}");

    REQUIRE(f.tracker.interpolate(f.tr.snapshot("int main() {\n    return 0;\n|\n"), &out));
    CHECK(out == "}");
}

TEST_CASE("Completion_Tracker set_completion replaces") {
    Tracker_Fixture f;
    f.install("function", "x = |;");
    f.install("const", "x = |;");
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::REPLACED);

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = c|;"), &out));
    CHECK(out == "onst");
}

TEST_CASE("Completion_Tracker set_completion with its own interpolated text") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    Document_Snapshot snapshot = f.tr.snapshot("x = fun|;");
    cz::Str out;
    REQUIRE(f.tracker.interpolate(snapshot, &out));
    REQUIRE(out == "ction");

    f.tracker.set_completion(out, snapshot, snapshot.cursor);
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::REPLACED);
    CHECK(f.tracker.state.completion.as_str() == "ction");
    CHECK(f.tracker.state.base_document_text.as_str() == "x = fun;");

    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = func|;"), &out));
    CHECK(out == "tion");
}

TEST_CASE("Completion_Tracker clear_completion") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    f.tracker.clear_completion();
    CHECK_FALSE(f.tracker.has_active_completion());
    CHECK(f.tracker.has_conflict(f.tr.snapshot("x = |;")));

    f.tracker.clear_completion();
    CHECK_FALSE(f.tracker.has_active_completion());
    CHECK(f.tracker.has_conflict(f.tr.snapshot("x = |;")));
}

TEST_CASE("Completion_Tracker snapshot is copied") {
    Tracker_Fixture f;

    cz::String text = cz::Str("x = ;").clone(cz::heap_allocator());
    cz::String identity = cz::Str("test.cpp").clone(cz::heap_allocator());
    Document_Snapshot snapshot = {text.as_str(), {0, 4}, identity.as_str()};
    f.tracker.set_completion("function", snapshot, snapshot.cursor);
    text.drop(cz::heap_allocator());
    identity.drop(cz::heap_allocator());

    CHECK(f.tracker.state.base_document_text.as_str() == "x = ;");
    CHECK(f.tracker.state.document_identity.as_str() == "test.cpp");

    cz::Str out;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("x = f|;"), &out));
    CHECK(out == "unction");
}

TEST_CASE("Completion_Tracker accept_completion") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::String out = {};
    CZ_DEFER(out.drop(cz::heap_allocator()));
    REQUIRE(f.tracker.accept_completion(f.tr.snapshot("x = fun|;"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == "ction");
    CHECK_FALSE(f.tracker.has_active_completion());
    CHECK(f.tracker.last_withdraw_reason == Withdraw_Reason::ACCEPTED);
}

TEST_CASE("Completion_Tracker accept_completion conflict") {
    Tracker_Fixture f;
    f.install("function", "x = |;");

    cz::String out = {};
    CZ_DEFER(out.drop(cz::heap_allocator()));
    CHECK_FALSE(f.tracker.accept_completion(f.tr.snapshot("x = q|;"), cz::heap_allocator(), &out));
    CHECK(out.len == 0);
}

TEST_CASE("Completion_Tracker accept_next_word") {
    Tracker_Fixture f;
    f.install("print(a, b)", "|");

    cz::String out = {};
    CZ_DEFER(out.drop(cz::heap_allocator()));
    REQUIRE(f.tracker.accept_next_word(f.tr.snapshot("|"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == "print(a,");
    CHECK(f.tracker.has_active_completion());

    // The host inserts the word.
    cz::Str rest;
    REQUIRE(f.tracker.interpolate(f.tr.snapshot("print(a,|"), &rest));
    CHECK(rest == " b)");

    out.len = 0;
    REQUIRE(f.tracker.accept_next_word(f.tr.snapshot("print(a,|"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == " ");

    out.len = 0;
    REQUIRE(f.tracker.accept_next_word(f.tr.snapshot("print(a, |"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == "b)");
    CHECK_FALSE(f.tracker.has_active_completion());
}

TEST_CASE("Completion_Tracker accept_next_line") {
    Tracker_Fixture f;
    f.install("if (x) {\n    y();\n}", "|");

    cz::String out = {};
    CZ_DEFER(out.drop(cz::heap_allocator()));
    REQUIRE(f.tracker.accept_next_line(f.tr.snapshot("|"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == "if (x) {\n");
    CHECK(f.tracker.has_active_completion());

    out.len = 0;
    REQUIRE(f.tracker.accept_next_line(f.tr.snapshot("if (x) {\n|"), cz::heap_allocator(), &out));
    CHECK(out.as_str() == "    y();\n");

    out.len = 0;
    REQUIRE(f.tracker.accept_next_line(f.tr.snapshot("if (x) {\n    y();\n|"),
                                       cz::heap_allocator(), &out));
    CHECK(out.as_str() == "}");
    CHECK_FALSE(f.tracker.has_active_completion());
}
