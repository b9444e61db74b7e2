#include <catch2/catch_test_macros.hpp>
#include "fakes/fake_collaborators.h"

using namespace nbfacade;
using namespace nbfacade::testing;

TEST_CASE("NotebookSession identities", "[session]") {
    FacadeConfig::Instance().ResetToDefaults();
    auto session = MakeSession("/work/analysis.ipynb");

    REQUIRE(session->GetHumanUri() == "file:///work/analysis.ipynb");
    REQUIRE(session->GetPreviewUri() == "nb:///work/analysis.ipynb");
    REQUIRE(session->GetOverlayUri().empty());

    const std::string& shadow = session->GetShadowUri();
    REQUIRE(shadow.rfind("file://", 0) == 0);
    REQUIRE(shadow.find("analysis_") != std::string::npos);
    REQUIRE(shadow.size() > 10);
    REQUIRE(shadow.substr(shadow.size() - 10) == "_shadow.py");

    SECTION("Two sessions never share a shadow identity") {
        auto other = MakeSession("/work/analysis.ipynb");
        REQUIRE(other->GetShadowUri() != shadow);
    }

    SECTION("Overlay identity follows the open cell") {
        REQUIRE(session->GetSynchronizer().OpenOverlay(8));
        const std::string id = session->GetDocument().GetCell(2).id;
        REQUIRE(session->GetOverlayUri() == "nb-cell:///work/analysis.ipynb#" + id);
    }
}

TEST_CASE("NotebookSession views start consistent", "[session]") {
    auto session = MakeSession("/work/views.ipynb");

    REQUIRE(session->GetHumanView().GetLineCount() == 10);
    REQUIRE(session->GetShadowView().GetLineCount() == 10);
    REQUIRE(session->GetShadowView().GetLine(1) == std::string("x = 1"));
    REQUIRE(session->CellAt(5) == session->GetDocument().GetCell(1).id);
    REQUIRE(session->ContentRangeOf(session->GetDocument().GetCell(2).id) == LineRange{8, 8});
}

TEST_CASE("NotebookSession language change", "[session]") {
    auto session = MakeSession("/work/lang.ipynb");
    const std::string old_shadow = session->GetShadowUri();

    std::string seen_old;
    std::string seen_new;
    session->AddLanguageChangedListener([&](const std::string& old_uri, const std::string& new_uri) {
        seen_old = old_uri;
        seen_new = new_uri;
    });

    session->SetLanguage("julia");
    REQUIRE(session->GetLanguage() == "julia");
    REQUIRE(seen_old == old_shadow);
    REQUIRE(seen_new == session->GetShadowUri());
    REQUIRE(seen_new.substr(seen_new.size() - 3) == ".jl");

    SECTION("Same language is a no-op") {
        seen_new.clear();
        session->SetLanguage("julia");
        REQUIRE(seen_new.empty());
    }
}

TEST_CASE("NotebookSession persistence", "[session]") {
    auto session = MakeSession("/work/persist.ipynb");
    FakeSerializer serializer;

    SECTION("Load replaces the document") {
        const std::string bytes = std::string("code|a = 1\nb = 2") + '\x1e' + "markdown|notes";
        REQUIRE(session->LoadFrom(serializer, bytes));
        REQUIRE(session->GetDocument().GetCellCount() == 2);
        REQUIRE(session->GetHumanView().GetLineCount() == 7);
        REQUIRE(session->GetShadowView().GetLines() ==
                std::vector<std::string>{"", "a = 1", "b = 2", "", "", "", ""});
        REQUIRE_FALSE(session->GetHumanView().CanUndo());
    }

    SECTION("Language from the file produces a new shadow identity") {
        const std::string old_shadow = session->GetShadowUri();
        serializer.language = "r";
        REQUIRE(session->LoadFrom(serializer, "code|x <- 1"));
        REQUIRE(session->GetShadowUri() != old_shadow);
        REQUIRE(session->GetShadowUri().substr(session->GetShadowUri().size() - 2) == ".r");
    }

    SECTION("Unparseable bytes leave the document alone") {
        REQUIRE_FALSE(session->LoadFrom(serializer, ""));
        REQUIRE(session->GetDocument().GetCellCount() == 3);
    }

    SECTION("Save writes the current cells") {
        session->GetSynchronizer().ReplaceCellContent(session->GetDocument().GetCell(2).id, {"print(y)"});
        const std::string bytes = session->SaveWith(serializer);
        REQUIRE(bytes == std::string("code|x = 1\ny = 2") + '\x1e' + "markdown|# Title" + '\x1e' + "code|print(y)");
    }
}

TEST_CASE("NotebookSession execution", "[session]") {
    auto session = MakeSession("/work/exec.ipynb");
    auto backend = std::make_shared<FakeExecutionBackend>();
    auto renderer = std::make_shared<FakeRenderer>();
    session->SetExecutionBackend(backend);
    session->SetOutputRenderer(renderer);

    const std::string code = session->GetDocument().GetCell(0).id;
    const std::string markdown = session->GetDocument().GetCell(1).id;

    SECTION("Results are stored on the next task cycle") {
        backend->result.success = true;
        backend->result.execution_count = 3;
        backend->result.outputs = json::array({{{"output_type", "stream"}, {"text", "1\n"}}});

        REQUIRE(session->ExecuteCell(code));
        REQUIRE(backend->executed.back().second == "x = 1\ny = 2");
        REQUIRE(session->GetDocument().GetCell(0).outputs.empty());

        session->ProcessPendingTasks();
        REQUIRE(session->GetDocument().GetCell(0).execution_count == 3);
        REQUIRE(session->GetDocument().GetCell(0).outputs.size() == 1);
        REQUIRE(renderer->rendered.count(code) == 1);
    }

    SECTION("Failures become an error output") {
        backend->result.success = false;
        backend->result.error_message = "NameError";

        REQUIRE(session->ExecuteCell(code));
        session->ProcessPendingTasks();

        const auto& outputs = session->GetDocument().GetCell(0).outputs;
        REQUIRE(outputs.size() == 1);
        REQUIRE(outputs[0]["output_type"] == "error");
        REQUIRE(outputs[0]["evalue"] == "NameError");
    }

    SECTION("Results for deleted cells are dropped") {
        backend->defer = true;
        REQUIRE(session->ExecuteCell(code));
        REQUIRE(session->GetSynchronizer().DeleteCell(code));

        backend->pending();
        session->ProcessPendingTasks();
        REQUIRE(renderer->rendered.empty());
    }

    SECTION("Only code cells run") {
        REQUIRE_FALSE(session->ExecuteCell(markdown));
        REQUIRE_FALSE(session->ExecuteCell("missing"));
        backend->available = false;
        REQUIRE_FALSE(session->ExecuteCell(code));
        REQUIRE(backend->executed.empty());
    }

    SECTION("Clearing outputs") {
        backend->result.success = true;
        backend->result.outputs = json::array({{{"output_type", "stream"}, {"text", "ok"}}});
        session->ExecuteCell(code);
        session->ProcessPendingTasks();

        session->ClearAllOutputs();
        REQUIRE(session->GetDocument().GetCell(0).outputs.empty());
        REQUIRE(renderer->cleared.size() == 3);

        session->RenderAllOutputs();
        REQUIRE(renderer->rendered.empty());
    }
}

TEST_CASE("NotebookSession listeners", "[session]") {
    auto session = MakeSession("/work/listen.ipynb");
    session->ProcessPendingTasks();

    int view_calls = 0;
    std::string closed_cell;
    ListenerId view_id = session->AddViewChangedListener([&](const std::vector<ViewChange>&) { ++view_calls; });
    session->AddOverlayClosedListener([&](const std::string& cell_id, uint64_t) { closed_cell = cell_id; });

    REQUIRE(session->GetSynchronizer().OpenOverlay(1));
    session->GetSynchronizer().ApplyOverlayEdit(0, 1, {"x = 5"});
    session->GetSynchronizer().CloseOverlay();
    REQUIRE(closed_cell == session->GetDocument().GetCell(0).id);

    session->ProcessPendingTasks();
    REQUIRE(view_calls == 1);

    session->RemoveListener(view_id);
    session->GetSynchronizer().InsertCell(0, CellKind::Code);
    session->ProcessPendingTasks();
    REQUIRE(view_calls == 1);
}
