#pragma once

#include <jx/json.h>
#include <string>

namespace jx {

// Command line of the jsonex tool
class CliArgs {
public:
    enum class Action {
        HELP,   // Show help message
        PARSE   // Parse the file and print a preview
    };

    // Throws std::invalid_argument on unknown options or missing values.
    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    const Options& getOptions() const { return options_; }
    bool isVerbose() const { return verbose_; }

private:
    Action action_ = Action::HELP;
    std::string filePath_;
    Options options_;
    bool verbose_ = false;
};

} // namespace jx
