#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langid::cli {

/**
 * Detect every line of a file, printing one JSON result per line.
 */
class BatchCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "batch"; }
    std::string description() const override {
        return "Detect each line of a file (\"-\" reads stdin)";
    }

private:
    std::string path_;
    bool detailed_ = false;
    bool stats_ = false;
};

}  // namespace langid::cli
