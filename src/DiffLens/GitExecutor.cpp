// =================================================================
// src/DiffLens/GitExecutor.cpp
// =================================================================
// Implementation for running git subprocesses.

#include "DiffLens/GitExecutor.hpp"
#include "DiffLens/Logger.hpp"
#include <array>
#include <cstdio>
#include <memory>
#include <sys/wait.h>

namespace DiffLens {

ProcessGitExecutor::ProcessGitExecutor(std::string repo_path, size_t max_buffer_bytes)
    : m_repo_path(std::move(repo_path)), m_max_buffer_bytes(max_buffer_bytes) {}

std::string ProcessGitExecutor::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string ProcessGitExecutor::run(const std::vector<std::string>& args) {
    std::string display = "git";
    std::string full_command = "git -C " + shellQuote(m_repo_path);
    for (const auto& arg : args) {
        full_command += " " + shellQuote(arg);
        display += " " + arg;
    }

    LOG_DEBUG("GitExecutor", "Running: " + display);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw GitError("Failed to execute command: " + display);
    }

    std::array<char, 65536> buffer;
    std::string result;
    bool too_large = false;
    size_t read = 0;
    while ((read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        if (result.size() + read > m_max_buffer_bytes) {
            too_large = true;
            break;
        }
        result.append(buffer.data(), read);
    }

    // Closing the read end makes a still-writing child fail with EPIPE.
    int exit_status = pclose(pipe.release());

    if (too_large) {
        throw GitOutputTooLargeError("Output of '" + display + "' exceeds " +
                                     std::to_string(m_max_buffer_bytes) + " bytes");
    }

    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        exit_status = -1;
    }

    if (exit_status != 0) {
        throw GitError("Command '" + display + "' failed with exit code " +
                       std::to_string(exit_status), exit_status);
    }
    return result;
}

} // namespace DiffLens
