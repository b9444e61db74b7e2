#include <catch2/catch_test_macros.hpp>
#include <nbfacade/text_view.h>

using namespace nbfacade;

TEST_CASE("TextView line access", "[text_view]") {
    TextView view;
    view.Reset({"a", "b", "c"});

    REQUIRE(view.GetLineCount() == 3);
    REQUIRE(view.GetLine(1) == std::string("b"));
    REQUIRE_FALSE(view.GetLine(3).has_value());
    REQUIRE(view.GetLines(1, 10) == std::vector<std::string>{"b", "c"});

    SECTION("Invalid ranges change nothing") {
        const uint64_t tick = view.GetChangeTick();
        REQUIRE_FALSE(view.SetLines(2, 1, {"x"}));
        REQUIRE_FALSE(view.SetLines(0, 4, {"x"}));
        REQUIRE(view.GetChangeTick() == tick);
    }

    SECTION("Replace, insert and delete") {
        REQUIRE(view.SetLines(1, 2, {"B1", "B2"}));
        REQUIRE(view.GetLines() == std::vector<std::string>{"a", "B1", "B2", "c"});
        REQUIRE(view.SetLines(4, 4, {"d"}));
        REQUIRE(view.SetLines(0, 1, {}));
        REQUIRE(view.GetLines() == std::vector<std::string>{"B1", "B2", "c", "d"});
    }

    SECTION("No history unless recording") {
        view.SetLines(0, 1, {"x"});
        REQUIRE_FALSE(view.CanUndo());
    }
}

TEST_CASE("TextView undo history", "[text_view]") {
    TextView view(true);
    view.Reset({"a", "b"});

    SECTION("Each edit is one step") {
        view.SetLines(0, 1, {"x"});
        view.SetLines(1, 2, {"y", "z"});
        REQUIRE(view.GetUndoDepth() == 2);

        REQUIRE(view.Undo());
        REQUIRE(view.GetLines() == std::vector<std::string>{"x", "b"});
        REQUIRE(view.Undo());
        REQUIRE(view.GetLines() == std::vector<std::string>{"a", "b"});
        REQUIRE_FALSE(view.Undo());

        REQUIRE(view.Redo());
        REQUIRE(view.Redo());
        REQUIRE(view.GetLines() == std::vector<std::string>{"x", "y", "z"});
    }

    SECTION("Groups coalesce into one step") {
        view.BeginUndoGroup();
        view.SetLines(0, 1, {"x"});
        view.SetLines(2, 2, {"c"});
        view.BeginUndoGroup();
        view.SetLines(1, 2, {});
        view.CommitUndoGroup();
        REQUIRE(view.IsGrouping());
        REQUIRE_FALSE(view.Undo());
        view.CommitUndoGroup();

        REQUIRE(view.GetUndoDepth() == 1);
        REQUIRE(view.GetLines() == std::vector<std::string>{"x", "c"});
        REQUIRE(view.Undo());
        REQUIRE(view.GetLines() == std::vector<std::string>{"a", "b"});
    }

    SECTION("Empty group leaves no step") {
        view.BeginUndoGroup();
        view.CommitUndoGroup();
        REQUIRE(view.GetUndoDepth() == 0);
    }

    SECTION("New edit clears redo") {
        view.SetLines(0, 1, {"x"});
        view.Undo();
        REQUIRE(view.CanRedo());
        view.SetLines(0, 1, {"y"});
        REQUIRE_FALSE(view.CanRedo());
    }
}
