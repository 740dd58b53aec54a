#include "detect_command.hpp"

#include <langid/json.hpp>

#include <iomanip>

namespace langid::cli {

void DetectCommand::setup(CLI::App& app) {
    app.add_option("text", text_, "Text to classify")
        ->type_name("<text>");

    app.add_flag("--stdin", from_stdin_, "Read the text from stdin");
    app.add_flag("-d,--detailed", detailed_, "Include hints and candidates");
    app.add_flag("--json", json_, "Print the result as JSON");
}

int DetectCommand::execute(CommandContext& ctx) {
    if (from_stdin_ && !text_.empty()) {
        std::cerr << "Error: Pass the text as an argument or with --stdin, not both\n";
        return LANGID_EXIT_USER_ERROR;
    }
    if (!from_stdin_ && text_.empty()) {
        std::cerr << "Usage: langid detect <text> [-d] [--json]\n";
        std::cerr << "       echo <text> | langid detect --stdin\n";
        return LANGID_EXIT_USER_ERROR;
    }

    std::string text = from_stdin_ ? read_stdin() : text_;
    if (from_stdin_ && std::cin.bad()) {
        std::cerr << "Error: Failed to read stdin\n";
        return LANGID_EXIT_IO_ERROR;
    }

    DetectionResult result = ctx.detector->detect(text, detailed_);

    if (json_) {
        nlohmann::json j = result;
        std::cout << j.dump(2) << "\n";
    } else {
        print_plain(result);
    }

    return LANGID_EXIT_SUCCESS;
}

void DetectCommand::print_plain(const DetectionResult& result) const {
    std::cout << result.language << "\t"
              << std::fixed << std::setprecision(4) << result.confidence << "\t"
              << method_name(result.method) << "\n";

    if (!result.diagnostics) {
        return;
    }

    const auto& diag = *result.diagnostics;
    for (const auto& hint : diag.hints) {
        std::cout << "  hint      " << std::left << std::setw(24) << hint.tag
                  << hint.language << "  \"" << hint.matched << "\""
                  << " @" << hint.offset
                  << " (priority " << hint.priority << ")\n";
    }
    for (const auto& candidate : diag.candidates) {
        std::cout << "  candidate " << std::left << std::setw(24) << candidate.language
                  << candidate.probability << "\n";
    }
    if (diag.timed_out) {
        std::cout << "  classifier timed out\n";
    }
    if (!diag.reason.empty()) {
        std::cout << "  reason    " << diag.reason << "\n";
    }
}

}  // namespace langid::cli
