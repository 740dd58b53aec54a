#include "languages_command.hpp"

#include <langid/classifier/builtin_corpus.hpp>

#include <iomanip>

namespace langid::cli {

void LanguagesCommand::setup(CLI::App&) {}

int LanguagesCommand::execute(CommandContext& ctx) {
    const auto& corpus = builtin_corpus();
    auto languages = ctx.detector->supported_languages();

    for (const auto& code : languages) {
        std::string display = "(custom profile)";
        for (const auto& entry : corpus) {
            if (entry.code == code) {
                display = entry.name;
                break;
            }
        }
        std::cout << std::left << std::setw(6) << code << display << "\n";
    }

    std::cout << "\n" << languages.size() << " language(s), default "
              << ctx.detector->config().default_language << "\n";
    return LANGID_EXIT_SUCCESS;
}

}  // namespace langid::cli
