#pragma once

#include <bru/encode.h>
#include <string>

namespace bru {

// Parses command-line arguments for the brufmt tool
class CliArgs {
public:
    enum class Action {
        HELP,     // Show help message
        SUMMARY,  // Parse and list the blocks (default)
        CHECK,    // Validate only
        FORMAT,   // Decode and re-encode
        JSON      // Print the blocks as JSON
    };

    // Throws std::invalid_argument for unknown options, missing option
    // values, conflicting actions or a missing input file.
    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    bool hasOutputPath() const { return not outputPath_.empty(); }
    const std::string& getOutputPath() const { return outputPath_; }
    const EncodeOptions& getEncodeOptions() const { return encodeOptions_; }
    int getIndent() const { return encodeOptions_.indent; }
    bool isVerbose() const { return verbose_; }

private:
    void setAction(Action action, const std::string& flag);

    Action action_ = Action::SUMMARY;
    bool actionSet_ = false;
    std::string actionFlag_;
    std::string filePath_;
    std::string outputPath_;
    EncodeOptions encodeOptions_;
    bool verbose_ = false;
};

}  // namespace bru
