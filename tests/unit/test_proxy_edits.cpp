#include <catch2/catch_test_macros.hpp>
#include "fakes/fake_collaborators.h"

using namespace nbfacade;
using namespace nbfacade::lsp;
using namespace nbfacade::testing;

namespace {

struct EditFixture {
    std::shared_ptr<FakeAnalysisBackend> backend = std::make_shared<FakeAnalysisBackend>();
    std::shared_ptr<NotebookSession> session;
    ProtocolProxy proxy;

    EditFixture() {
        SessionRegistry::Instance().Clear();
        FacadeConfig::Instance().ResetToDefaults();

        session = MakeSession("/work/edits.ipynb");
        proxy.SetBackend(backend);
        proxy.AttachSession(session);
    }

    ~EditFixture() {
        SessionRegistry::Instance().Clear();
        FacadeConfig::Instance().ResetToDefaults();
    }

    std::string Human() const { return session->GetHumanUri(); }
    std::string Shadow() const { return session->GetShadowUri(); }
    std::string CellId(size_t index) const { return session->GetDocument().GetCell(index).id; }
    const std::vector<std::string>& Source(size_t index) const { return session->GetDocument().GetCell(index).source; }
    const TextView& HumanView() const { return session->GetHumanView(); }
};

} // namespace

TEST_CASE("Formatting one cell", "[proxy][format]") {
    EditFixture f;
    const std::string last = f.CellId(2);

    int calls = 0;
    auto id = f.proxy.FormatCell(f.session, last, [&calls](const json& error, const json&) {
        REQUIRE(error.is_null());
        ++calls;
    });
    REQUIRE(id.has_value());

    const auto& sent = f.backend->Last();
    REQUIRE(sent.method == "textDocument/rangeFormatting");
    REQUIRE(sent.params["textDocument"]["uri"] == f.Shadow());
    REQUIRE(sent.params["range"] == RangeJson(8, 0, 9, 0));
    REQUIRE(sent.params["options"]["tabSize"] == 4);
    REQUIRE(sent.params["options"]["insertSpaces"] == true);

    SECTION("Edits land in the cell with trailing blank lines trimmed") {
        REQUIRE(f.proxy.OnResponse(*id, json::array({EditJson(8, 0, 9, 0, "print(x)  # done\n\n\n")})));
        REQUIRE(calls == 1);
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)  # done"});
        REQUIRE(f.HumanView().GetLineCount() == 10);
        REQUIRE(f.session->GetShadowView().GetLine(8) == std::string("print(x)  # done"));
        REQUIRE(f.HumanView().GetUndoDepth() == 1);
    }

    SECTION("Configured blank lines are kept") {
        FacadeConfig::Instance().SetTrailingBlankLines(1);
        f.proxy.OnResponse(*id, json::array({EditJson(8, 0, 9, 0, "print(x)\n\n\n")}));
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)", ""});
        REQUIRE(f.HumanView().GetLineCount() == 11);
    }

    SECTION("Reply after the document changed is dropped") {
        f.session->GetSynchronizer().ApplyHumanEdit(1, 2, {"x = 2"});
        REQUIRE(f.proxy.OnResponse(*id, json::array({EditJson(8, 0, 8, 8, "print(y)")})));
        REQUIRE(calls == 1);
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)"});
    }

    SECTION("Non-code cells are not formatted") {
        REQUIRE_FALSE(f.proxy.FormatCell(f.session, f.CellId(1)));
        REQUIRE_FALSE(f.proxy.FormatCell(f.session, "missing"));
    }

    SECTION("Disabled formatting sends nothing") {
        FacadeConfig::Instance().SetFormatEnabled(false);
        const size_t sent_count = f.backend->requests.size();
        REQUIRE_FALSE(f.proxy.FormatCell(f.session, last));
        REQUIRE_FALSE(f.proxy.Request(f.Human(), "textDocument/formatting", json::object(), nullptr));
        REQUIRE(f.backend->requests.size() == sent_count);
    }
}

TEST_CASE("Formatting from the overlay formats its cell", "[proxy][format]") {
    EditFixture f;

    REQUIRE(f.session->GetSynchronizer().OpenOverlay(1));
    const std::string overlay = f.session->GetOverlayUri();

    auto id = f.proxy.Request(overlay, "textDocument/formatting", {{"textDocument", {{"uri", overlay}}}}, nullptr);
    REQUIRE(id.has_value());
    REQUIRE(f.backend->requests.size() == 1);
    REQUIRE(f.backend->Last().params["range"] == RangeJson(1, 0, 3, 0));

    REQUIRE(f.proxy.OnResponse(*id, json::array({EditJson(1, 0, 1, 5, "x  = 1")})));
    REQUIRE(f.Source(0) == std::vector<std::string>{"x  = 1", "y = 2"});
    REQUIRE(f.session->GetSynchronizer().GetOverlay()->GetBuffer().GetLines() ==
            std::vector<std::string>{"x  = 1", "y = 2"});
}

TEST_CASE("Formatting the whole notebook is one undo step", "[proxy][format]") {
    EditFixture f;

    int calls = 0;
    auto first = f.proxy.Request(f.Human(), "textDocument/formatting",
                                 {{"textDocument", {{"uri", f.Human()}}}},
                                 [&calls](const json&, const json&) { ++calls; });
    REQUIRE(first.has_value());
    REQUIRE(f.backend->requests.size() == 2);

    const int64_t first_id = f.backend->requests[0].id;
    const int64_t second_id = f.backend->requests[1].id;
    REQUIRE(*first == first_id);
    REQUIRE(f.backend->requests[0].params["range"] == RangeJson(1, 0, 3, 0));
    REQUIRE(f.backend->requests[1].params["range"] == RangeJson(8, 0, 9, 0));

    SECTION("Edits are applied once every cell replied") {
        REQUIRE(f.proxy.OnResponse(first_id, json::array({EditJson(1, 0, 3, 0, "x = 1\n\ny = 2\n")})));
        REQUIRE(calls == 0);
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});

        REQUIRE(f.proxy.OnResponse(second_id, json::array({EditJson(8, 0, 9, 0, "print( x )\n")})));
        REQUIRE(calls == 1);

        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print( x )"});
        REQUIRE(f.HumanView().GetLine(9) == std::string("print( x )"));
        REQUIRE(f.HumanView().GetLineCount() == f.session->GetShadowView().GetLineCount());
        REQUIRE(f.HumanView().GetUndoDepth() == 1);

        REQUIRE(f.session->GetSynchronizer().Undo());
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)"});
    }

    SECTION("Failed cells are skipped") {
        f.proxy.OnResponse(first_id, nullptr, {{"code", -32603}, {"message", "formatter crashed"}});
        f.proxy.OnResponse(second_id, json::array({EditJson(8, 0, 9, 0, "print( x )\n")}));
        REQUIRE(calls == 1);
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print( x )"});
    }

    SECTION("A document change before the last reply drops everything") {
        f.proxy.OnResponse(first_id, json::array({EditJson(1, 0, 1, 5, "x=1")}));
        f.session->GetSynchronizer().InsertCell(3, CellKind::Code, {"z = 3"});
        f.proxy.OnResponse(second_id, json::array({EditJson(8, 0, 8, 8, "print(z)")}));

        REQUIRE(calls == 1);
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)"});
    }
}

TEST_CASE("Range formatting must stay inside one code cell", "[proxy][format]") {
    EditFixture f;

    auto range_params = [](const std::string& uri, int sl, int sc, int el, int ec) {
        return json{{"textDocument", {{"uri", uri}}}, {"range", RangeJson(sl, sc, el, ec)}};
    };

    SECTION("Range across cells is refused") {
        REQUIRE_FALSE(f.proxy.Request(f.Human(), "textDocument/rangeFormatting",
                                      range_params(f.Human(), 1, 0, 5, 0), nullptr));
        REQUIRE_FALSE(f.proxy.Request(f.Human(), "textDocument/rangeFormatting",
                                      range_params(f.Human(), 0, 0, 2, 0), nullptr));
        REQUIRE_FALSE(f.proxy.Request(f.Human(), "textDocument/rangeFormatting",
                                      range_params(f.Human(), 5, 0, 5, 3), nullptr));
        REQUIRE(f.backend->requests.empty());
    }

    SECTION("Range inside a cell is applied without trimming") {
        auto id = f.proxy.Request(f.Human(), "textDocument/rangeFormatting",
                                  range_params(f.Human(), 1, 0, 3, 0), nullptr);
        REQUIRE(id.has_value());
        REQUIRE(f.backend->Last().params["textDocument"]["uri"] == f.Shadow());
        REQUIRE(f.backend->Last().params["options"]["tabSize"] == 4);

        f.proxy.OnResponse(*id, json::array({EditJson(2, 0, 2, 5, "y = 2\n")}));
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2", ""});
    }

    SECTION("Overlay ranges are shifted into the document") {
        REQUIRE(f.session->GetSynchronizer().OpenOverlay(8));
        const std::string overlay = f.session->GetOverlayUri();

        json params = range_params(overlay, 0, 0, 0, 8);
        params["options"] = {{"tabSize", 2}, {"insertSpaces", true}};
        auto id = f.proxy.Request(overlay, "textDocument/rangeFormatting", params, nullptr);
        REQUIRE(id.has_value());
        REQUIRE(f.backend->Last().params["range"] == RangeJson(8, 0, 8, 8));
        REQUIRE(f.backend->Last().params["options"]["tabSize"] == 2);
    }
}

TEST_CASE("Rename applies workspace edits per cell", "[proxy][rename]") {
    EditFixture f;

    json applied;
    auto id = f.proxy.Request(f.Human(), "textDocument/rename",
        {{"textDocument", {{"uri", f.Human()}}}, {"position", PositionJson(1, 0)}, {"newName", "z"}},
        [&applied](const json&, const json& result) { applied = result; });
    REQUIRE(id.has_value());
    REQUIRE(f.backend->Last().params["textDocument"]["uri"] == f.Shadow());
    REQUIRE(f.backend->Last().params["newName"] == "z");

    json edits = json::array({
        EditJson(1, 0, 1, 1, "z"),
        EditJson(8, 6, 8, 7, "z"),
        EditJson(3, 0, 3, 1, "z"),
        EditJson(5, 2, 5, 7, "z")
    });

    SECTION("changes map") {
        json result = {{"changes", {{f.Shadow(), edits}, {"file:///work/other.py", json::array({EditJson(0, 0, 0, 1, "z")})}}}};
        REQUIRE(f.proxy.OnResponse(*id, result));

        REQUIRE(applied["applied"] == 2);
        REQUIRE(f.Source(0) == std::vector<std::string>{"z = 1", "y = 2"});
        REQUIRE(f.Source(1) == std::vector<std::string>{"# Title"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(z)"});
        REQUIRE(f.HumanView().GetLine(3) == std::string("# <</nbfacade>>"));
        REQUIRE(f.HumanView().GetUndoDepth() == 1);

        REQUIRE(f.session->GetSynchronizer().Undo());
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)"});
    }

    SECTION("documentChanges list") {
        json result = {{"documentChanges", json::array({
            {{"textDocument", {{"uri", f.Shadow()}, {"version", 1}}}, {"edits", edits}},
            {{"textDocument", {{"uri", "file:///work/other.py"}, {"version", 1}}},
             {"edits", json::array({EditJson(0, 0, 0, 1, "z")})}},
            {{"kind", "create"}, {"uri", "file:///work/new.py"}}
        })}};
        REQUIRE(f.proxy.OnResponse(*id, result));

        REQUIRE(applied["applied"] == 2);
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(z)"});
    }

    SECTION("Stale rename is dropped") {
        f.session->GetSynchronizer().ApplyHumanEdit(8, 9, {"print(x, x)"});
        REQUIRE(f.proxy.OnResponse(*id, {{"changes", {{f.Shadow(), edits}}}}));

        REQUIRE(applied["applied"] == 0);
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x, x)"});
    }

    SECTION("Empty result applies nothing") {
        REQUIRE(f.proxy.OnResponse(*id, nullptr));
        REQUIRE(applied["applied"] == 0);
        REQUIRE_FALSE(f.HumanView().CanUndo());
    }
}

TEST_CASE("Rename from the overlay refreshes the overlay buffer", "[proxy][rename]") {
    EditFixture f;
    auto& sync = f.session->GetSynchronizer();

    REQUIRE(sync.OpenOverlay(8));
    const std::string overlay = f.session->GetOverlayUri();

    auto id = f.proxy.Request(overlay, "textDocument/rename",
        {{"textDocument", {{"uri", overlay}}}, {"position", PositionJson(0, 6)}, {"newName", "w"}}, nullptr);
    REQUIRE(id.has_value());
    REQUIRE(f.backend->Last().params["position"]["line"] == 8);

    json result = {{"changes", {{f.Shadow(), json::array({EditJson(1, 0, 1, 1, "w"), EditJson(8, 6, 8, 7, "w")})}}}};
    REQUIRE(f.proxy.OnResponse(*id, result));

    REQUIRE(f.Source(0) == std::vector<std::string>{"w = 1", "y = 2"});
    REQUIRE(sync.GetOverlay()->GetBuffer().GetLines() == std::vector<std::string>{"print(w)"});
}

TEST_CASE("A newer edit request replaces a pending one of the same kind", "[proxy][format][rename]") {
    EditFixture f;
    const std::string last = f.CellId(2);

    SECTION("Formatting the same cell twice") {
        int calls = 0;
        auto older = f.proxy.FormatCell(f.session, last, [&calls](const json&, const json&) { ++calls; });
        auto newer = f.proxy.FormatCell(f.session, last, [&calls](const json&, const json&) { ++calls; });
        REQUIRE(older.has_value());
        REQUIRE(newer.has_value());
        REQUIRE(f.proxy.GetTracker().GetPendingCount() == 1);

        REQUIRE_FALSE(f.proxy.OnResponse(*older, json::array({EditJson(8, 0, 8, 8, "x = 'old'")})));
        REQUIRE(calls == 0);
        REQUIRE(f.Source(2) == std::vector<std::string>{"print(x)"});
        REQUIRE_FALSE(f.HumanView().CanUndo());

        REQUIRE(f.proxy.OnResponse(*newer, json::array({EditJson(8, 0, 8, 8, "print( x )")})));
        REQUIRE(calls == 1);
        REQUIRE(f.Source(2) == std::vector<std::string>{"print( x )"});
    }

    SECTION("Formatting different cells keeps both") {
        auto first = f.proxy.FormatCell(f.session, f.CellId(0));
        auto second = f.proxy.FormatCell(f.session, last);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(f.proxy.GetTracker().GetPendingCount() == 2);
    }

    SECTION("Renaming twice") {
        json params = {{"textDocument", {{"uri", f.Human()}}}, {"position", PositionJson(1, 0)}, {"newName", "a"}};
        auto older = f.proxy.Request(f.Human(), "textDocument/rename", params, nullptr);
        params["newName"] = "b";
        auto newer = f.proxy.Request(f.Human(), "textDocument/rename", params, nullptr);
        REQUIRE(older.has_value());
        REQUIRE(newer.has_value());

        REQUIRE_FALSE(f.proxy.OnResponse(*older, {{"changes", {{f.Shadow(), json::array({EditJson(1, 0, 1, 1, "a")})}}}}));
        REQUIRE(f.Source(0) == std::vector<std::string>{"x = 1", "y = 2"});

        REQUIRE(f.proxy.OnResponse(*newer, {{"changes", {{f.Shadow(), json::array({EditJson(1, 0, 1, 1, "b")})}}}}));
        REQUIRE(f.Source(0) == std::vector<std::string>{"b = 1", "y = 2"});
    }
}
