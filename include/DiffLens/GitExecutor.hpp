// =================================================================
// include/DiffLens/GitExecutor.hpp
// =================================================================
// The capability of running git subcommands against one repository.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief A git command could not be run or exited with a non-zero status.
 */
class GitError : public std::runtime_error {
public:
    explicit GitError(const std::string& message, int exit_code = -1)
        : std::runtime_error(message), m_exit_code(exit_code) {}

    int exitCode() const { return m_exit_code; }

private:
    int m_exit_code;
};

/**
 * @brief Output exceeded the configured buffer ceiling.
 */
class GitOutputTooLargeError : public GitError {
public:
    explicit GitOutputTooLargeError(const std::string& message) : GitError(message) {}
};

class GitExecutor {
public:
    virtual ~GitExecutor() = default;

    /**
     * @brief Runs "git <args...>" and returns its standard output.
     *
     * Throws GitError on a non-zero exit and GitOutputTooLargeError when the
     * output passes the buffer ceiling.
     */
    virtual std::string run(const std::vector<std::string>& args) = 0;

    /**
     * @brief Directory the commands run in.
     */
    virtual const std::string& repoPath() const = 0;
};

/**
 * @brief Runs git as a child process through the shell.
 */
class ProcessGitExecutor : public GitExecutor {
public:
    /**
     * @param repo_path Working directory passed to "git -C".
     * @param max_buffer_bytes Ceiling on captured stdout.
     */
    ProcessGitExecutor(std::string repo_path, size_t max_buffer_bytes);

    std::string run(const std::vector<std::string>& args) override;

    const std::string& repoPath() const override { return m_repo_path; }

    /**
     * @brief Quotes an argument for /bin/sh using single quotes.
     */
    static std::string shellQuote(const std::string& arg);

private:
    std::string m_repo_path;
    size_t m_max_buffer_bytes;
};

} // namespace DiffLens
