// main.cpp - Entry point for nbfacade-tool
// Headless inspection of human-view notebook text: shadow projection, cell table, invariant check

#include <nbfacade/nbfacade.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --input=PATH [options]\n"
              << "\nOptions:\n"
              << "  --input=PATH         Human-view text file (cells between # <<nbfacade:KIND>> markers)\n"
              << "  --mode=MODE          shadow | cells | check (default: shadow)\n"
              << "  --language=LANG      Analysis language (default: python)\n"
              << "  --config=PATH        Path to config file (default: ./nbfacade.json)\n"
              << "  --verbose            Enable debug logging\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

struct ToolOptions {
    std::string input_path;
    std::string mode = "shadow";
    std::string language;
    std::string config_path;
    bool verbose = false;
    bool help = false;
};

ToolOptions ParseArgs(int argc, char** argv) {
    ToolOptions options;

    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--input=", 8) == 0) {
            options.input_path = argv[i] + 8;
        } else if (std::strncmp(argv[i], "--mode=", 7) == 0) {
            options.mode = argv[i] + 7;
        } else if (std::strncmp(argv[i], "--language=", 11) == 0) {
            options.language = argv[i] + 11;
        } else if (std::strncmp(argv[i], "--config=", 9) == 0) {
            options.config_path = argv[i] + 9;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            options.help = true;
        } else {
            spdlog::warn("Unknown argument: {}", argv[i]);
        }
    }

    return options;
}

bool ReadLines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    lines = nbfacade::Cell::SplitLines(buffer.str());

    // Trailing newline of the file
    if (lines.size() > 1 && lines.back().empty()) {
        lines.pop_back();
    }
    return true;
}

void PrintCells(const nbfacade::NotebookSession& session) {
    const auto& cells = session.GetDocument().GetCells();
    for (size_t i = 0; i < cells.size(); ++i) {
        const auto& cell = cells[i];
        auto range = session.RangeOf(cell.id);
        std::cout << i << "\t" << cell.id << "\t" << nbfacade::CellKindName(cell.kind) << "\t";
        if (range) {
            std::cout << range->start << "-" << range->end;
        } else {
            std::cout << "-";
        }
        std::cout << "\t" << cell.LineCount() << " lines\n";
    }
}

int main(int argc, char** argv) {
    ToolOptions options = ParseArgs(argc, argv);
    if (options.help || options.input_path.empty()) {
        PrintUsage(argv[0]);
        return options.help ? 0 : 1;
    }

    if (!options.config_path.empty() && !nbfacade::FacadeConfig::Instance().Load(options.config_path)) {
        spdlog::error("Failed to load config {}", options.config_path);
        return 1;
    }

    nbfacade::Initialize();
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::vector<std::string> lines;
    if (!ReadLines(options.input_path, lines)) {
        spdlog::error("Cannot read {}", options.input_path);
        nbfacade::Shutdown();
        return 1;
    }

    nbfacade::Document document(nbfacade::LinesToCells(lines), nlohmann::json::object());
    if (!options.language.empty()) {
        document.SetLanguage(options.language);
    }

    auto session = nbfacade::NotebookSession::Create(options.input_path, std::move(document));

    int exit_code = 0;
    if (options.mode == "shadow") {
        for (const auto& line : session->GetShadowView().GetLines()) {
            std::cout << line << "\n";
        }
    } else if (options.mode == "cells") {
        PrintCells(*session);
    } else if (options.mode == "check") {
        const int human = session->GetHumanView().GetLineCount();
        const int shadow = session->GetShadowView().GetLineCount();
        const bool consistent = session->GetSynchronizer().VerifyInvariant();
        std::cout << "human lines:  " << human << "\n"
                  << "shadow lines: " << shadow << "\n"
                  << "cells:        " << session->GetDocument().GetCellCount() << "\n"
                  << "shadow uri:   " << session->GetShadowUri() << "\n"
                  << (consistent ? "OK" : "MISMATCH (shadow regenerated)") << std::endl;
        exit_code = consistent ? 0 : 2;
    } else {
        spdlog::error("Unknown mode: {}", options.mode);
        PrintUsage(argv[0]);
        exit_code = 1;
    }

    nbfacade::Shutdown();
    return exit_code;
}
