#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langid::cli {

/**
 * List the languages the statistical classifier can return.
 */
class LanguagesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "languages"; }
    std::string description() const override {
        return "List supported languages";
    }
};

}  // namespace langid::cli
