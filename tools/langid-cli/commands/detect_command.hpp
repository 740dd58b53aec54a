#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace langid::cli {

/**
 * Detect the language of one text, given as an argument or on stdin.
 */
class DetectCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "detect"; }
    std::string description() const override {
        return "Detect the language of a text";
    }

private:
    void print_plain(const DetectionResult& result) const;

    std::string text_;
    bool from_stdin_ = false;
    bool detailed_ = false;
    bool json_ = false;
};

}  // namespace langid::cli
