// =================================================================
// include/GitCC/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace GitCC {

class SysInteraction {
public:
    virtual ~SysInteraction() = default;

    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    virtual std::string readFile(const std::string& file_path);

    /**
     * @brief Replaces the content of a file as a whole.
     *
     * The content is written to `<file_path>.tmp` first and renamed over
     * the target, so readers see either the old or the new content.
     *
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return Empty string on success, otherwise a description of the failure.
     */
    virtual std::string replaceFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Removes a file. A missing file is not an error.
     * @return Empty string on success, otherwise a description of the failure.
     */
    virtual std::string removeFile(const std::string& file_path);

    /**
     * @brief Checks if a file exists.
     */
    virtual bool fileExists(const std::string& file_path);

    /**
     * @brief Writes content to a new, uniquely named file in the temp directory.
     * @param name_prefix Prefix of the file name.
     * @param content The content to write.
     * @return The path of the created file. Throws std::runtime_error on failure.
     */
    virtual std::string writeTempFile(const std::string& name_prefix, const std::string& content);

    /**
     * @brief Executes an external command and captures its standard output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing the stdout and the exit code.
     */
    virtual std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Runs an external command attached to this process's terminal.
     *
     * The child inherits stdin, stdout and stderr, so its own diagnostics
     * reach the user unchanged.
     *
     * @return The exit code of the command, -1 if it could not be started
     *         or terminated abnormally.
     */
    virtual int runCommand(const std::string& command, const std::vector<std::string>& args);
};

} // namespace GitCC
