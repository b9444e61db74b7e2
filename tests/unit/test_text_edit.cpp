#include <catch2/catch_test_macros.hpp>
#include <nbfacade/lsp/text_edit.h>
#include <string>

using namespace nbfacade::lsp;
using json = nlohmann::json;

namespace {

TextEdit MakeEdit(int sl, int sc, int el, int ec, const std::string& text) {
    return TextEdit{{{sl, sc}, {el, ec}}, text};
}

std::vector<std::string> NumberedLines(int count) {
    std::vector<std::string> lines;
    for (int i = 0; i < count; ++i) {
        lines.push_back("l" + std::to_string(i));
    }
    return lines;
}

} // namespace

TEST_CASE("TextEdit parsing", "[text_edit]") {
    json valid = {
        {"range", {{"start", {{"line", 2}, {"character", 1}}}, {"end", {{"line", 3}, {"character", 0}}}}},
        {"newText", "abc"}
    };

    auto edit = ParseTextEdit(valid);
    REQUIRE(edit.has_value());
    REQUIRE(edit->range.start.line == 2);
    REQUIRE(edit->range.start.character == 1);
    REQUIRE(edit->range.end.line == 3);
    REQUIRE(edit->new_text == "abc");
    REQUIRE(ToJson(*edit) == valid);

    SECTION("Malformed payloads") {
        REQUIRE_FALSE(ParseTextEdit(json::array()).has_value());
        REQUIRE_FALSE(ParseTextEdit({{"newText", "x"}}).has_value());

        json no_text = valid;
        no_text.erase("newText");
        REQUIRE_FALSE(ParseTextEdit(no_text).has_value());

        json bad_line = valid;
        bad_line["range"]["start"]["line"] = "2";
        REQUIRE_FALSE(ParseTextEdit(bad_line).has_value());
    }

    SECTION("Lists skip malformed entries") {
        json list = json::array({valid, 42, {{"range", nullptr}}, valid});
        REQUIRE(ParseTextEdits(list).size() == 2);
        REQUIRE(ParseTextEdits(json::object()).empty());
    }
}

TEST_CASE("TextEdit application", "[text_edit]") {
    SECTION("Single line replacement") {
        auto result = ApplyTextEdits({"x=1"}, {MakeEdit(0, 0, 0, 3, "x = 1")});
        REQUIRE(result == std::vector<std::string>{"x = 1"});
    }

    SECTION("Range spanning lines keeps prefix and suffix") {
        auto result = ApplyTextEdits({"a", "b", "c"}, {MakeEdit(0, 1, 2, 0, "X\nY")});
        REQUIRE(result == std::vector<std::string>{"aX", "Yc"});
    }

    SECTION("Edits apply bottom-up regardless of order") {
        const TextEdit upper = MakeEdit(5, 0, 6, 0, "");
        const TextEdit lower = MakeEdit(20, 0, 21, 0, "new\n");

        auto forward = ApplyTextEdits(NumberedLines(30), {upper, lower});
        auto backward = ApplyTextEdits(NumberedLines(30), {lower, upper});

        REQUIRE(forward == backward);
        REQUIRE(forward.size() == 29);
        REQUIRE(forward[5] == "l6");
        REQUIRE(forward[19] == "new");
        REQUIRE(forward[20] == "l21");
    }

    SECTION("Inserts at one position keep array order") {
        auto result = ApplyTextEdits({"ab"}, {MakeEdit(0, 1, 0, 1, "1"), MakeEdit(0, 1, 0, 1, "2")});
        REQUIRE(result == std::vector<std::string>{"a12b"});
    }

    SECTION("Whole-document replacement consumes the final newline") {
        auto result = ApplyTextEdits({"a", "b"}, {MakeEdit(0, 0, 2, 0, "x\ny\n")});
        REQUIRE(result == std::vector<std::string>{"x", "y"});
    }

    SECTION("Deleting the last line removes it") {
        auto result = ApplyTextEdits({"a", "b"}, {MakeEdit(1, 0, 2, 0, "")});
        REQUIRE(result == std::vector<std::string>{"a"});
    }

    SECTION("Deleting everything leaves one empty line") {
        auto result = ApplyTextEdits({"a", "b"}, {MakeEdit(0, 0, 2, 0, "")});
        REQUIRE(result == std::vector<std::string>{""});
    }

    SECTION("Appending after the last line") {
        auto result = ApplyTextEdits({"a"}, {MakeEdit(1, 0, 1, 0, "b")});
        REQUIRE(result == std::vector<std::string>{"a", "b"});
    }

    SECTION("Columns clamp and far ranges are ignored") {
        auto result = ApplyTextEdits({"ab"}, {MakeEdit(0, 10, 0, 20, "!"), MakeEdit(5, 0, 5, 0, "?")});
        REQUIRE(result == std::vector<std::string>{"ab!"});
    }
}

TEST_CASE("Trailing blank line trimming", "[text_edit]") {
    std::vector<std::string> lines = {"a", "", "  "};

    SECTION("Drop all") {
        TrimTrailingBlankLines(lines, 0);
        REQUIRE(lines == std::vector<std::string>{"a"});
    }

    SECTION("Keep one") {
        TrimTrailingBlankLines(lines, 1);
        REQUIRE(lines == std::vector<std::string>{"a", ""});
    }

    SECTION("Never empties the cell") {
        std::vector<std::string> blank = {"", ""};
        TrimTrailingBlankLines(blank, 0);
        REQUIRE(blank == std::vector<std::string>{""});
    }
}
