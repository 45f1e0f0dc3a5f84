#include "report_json.h"

#include "labelsheet/error.h"
#include "labelsheet/logging.h"
#include "labelsheet/pipeline.h"
#include "labelsheet/table_io.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace LabelSheet;

namespace {

constexpr const char* kEmptyTableMessage =
    "The uploaded workbook does not contain any rows to print.";

void PrintUsage(const char* exe) {
    std::printf("Usage: %s --input <orders.csv|orders.json> [--out labels.pdf]\n"
                "          [--cards cards.json] [--no-compress] [--log-level LEVEL]\n"
                "Defaults: --out labels.pdf --log-level info\n",
                exe);
}

bool WriteCardsJson(const std::string& path, const GenerateResult& result) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) { return false; }
    nlohmann::json j = {
        {"stats", GenerateStatsToJson(result.stats)},
        {"cards", LabelCardsToJson(result.cards)},
    };
    out << j.dump(2) << "\n";
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
    std::string input_path;
    std::string out_path = "labels.pdf";
    std::string cards_path;
    bool compress         = true;
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
            continue;
        }
        if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
            continue;
        }
        if (arg == "--cards" && i + 1 < argc) {
            cards_path = argv[++i];
            continue;
        }
        if (arg == "--no-compress") {
            compress = false;
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return 1;
    }
    if (input_path.empty()) {
        std::fprintf(stderr, "Error: --input is required\n");
        PrintUsage(argv[0]);
        return 1;
    }

    InitLogging(ParseLogLevel(log_level));

    try {
        GenerateRequest request;
        request.table = ReadOrderTable(input_path);
        if (request.table.Empty()) { throw EmptyInputError(kEmptyTableMessage); }
        request.compress_streams = compress;
        request.output_pdf_path  = out_path;

        GenerateResult result = Generate(request);

        if (!cards_path.empty()) {
            if (!WriteCardsJson(cards_path, result)) {
                spdlog::error("Failed to write cards to {}", cards_path);
                return 1;
            }
            spdlog::info("Saved cards to {}", cards_path);
        }
    } catch (const SchemaError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Failed to generate labels: {}", e.what());
        return 1;
    }
    return 0;
}
