#include "batch_command.hpp"

#include <langid/json.hpp>

#include <vector>

namespace langid::cli {

void BatchCommand::setup(CLI::App& app) {
    app.add_option("file", path_, "File with one text per line")
        ->required()
        ->type_name("<file>");

    app.add_flag("-d,--detailed", detailed_, "Include hints and candidates");
    app.add_flag("--stats", stats_, "Print detector statistics to stderr");
}

int BatchCommand::execute(CommandContext& ctx) {
    std::optional<std::string> content;
    if (path_ == "-") {
        content = read_stdin();
    } else {
        content = read_file(path_);
    }
    if (!content) {
        std::cerr << "Error: Cannot read " << path_ << "\n";
        return LANGID_EXIT_IO_ERROR;
    }

    std::vector<std::string> lines;
    std::istringstream in(*content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    auto results = ctx.detector->detect_batch(lines, detailed_);
    for (const auto& result : results) {
        nlohmann::json j = result;
        std::cout << j.dump() << "\n";
    }

    if (stats_) {
        nlohmann::json j = ctx.detector->stats();
        std::cerr << j.dump() << "\n";
    }

    return LANGID_EXIT_SUCCESS;
}

}  // namespace langid::cli
