#pragma once

/**
 * PostProcessor.hpp
 *
 * Work done on a file after its transfer completed: moving it into the
 * completed directory and running a user script on it.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace botarr::core::postprocess {

/**
 * Post-processing options ("postprocess" section of the configuration)
 */
struct PostProcessOptions {
    bool moveCompleted{false};
    std::filesystem::path moveCompletedDir;
    bool scriptEnabled{false};
    std::string script;
    std::chrono::seconds scriptTimeout{300};

    bool enabled() const { return moveCompleted || scriptEnabled; }

    static PostProcessOptions fromJson(const nlohmann::json& config);
    static PostProcessOptions fromConfig();
};

/**
 * Outcome of one post-processing run
 */
struct PostProcessResult {
    std::filesystem::path finalPath;
    bool moved{false};
    std::optional<int> exitCode;
    std::string output;               // script stdout and stderr
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }

    nlohmann::json toJson() const;
};

/**
 * PostProcessor - runs the post-download steps for a finished file.
 *
 * Failures are collected into the result and logged; nothing here throws.
 */
class PostProcessor {
public:
    static constexpr size_t kMaxScriptOutput = 64 * 1024;

    explicit PostProcessor(PostProcessOptions options);

    /**
     * Move the file (if enabled), then run the script on its final path
     * (if enabled)
     * @param file Completed download
     */
    PostProcessResult process(const std::filesystem::path& file) const;

    const PostProcessOptions& options() const { return m_options; }

    /**
     * Move a file into a directory, creating it when missing.
     * Uses rename and falls back to copy + remove across filesystems.
     * @param error Receives the reason on failure
     * @return New path of the file
     */
    static std::optional<std::filesystem::path> moveFile(const std::filesystem::path& file,
                                                         const std::filesystem::path& directory,
                                                         std::string& error);

private:
    void runScript(const std::filesystem::path& file, PostProcessResult& result) const;

private:
    PostProcessOptions m_options;
};

} // namespace botarr::core::postprocess
