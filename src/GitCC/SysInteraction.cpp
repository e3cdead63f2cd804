// =================================================================
// src/GitCC/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "GitCC/SysInteraction.hpp"
#include "GitCC/Logger.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <system_error>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <memory>
#include <array>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace GitCC {

// Quote an argument for /bin/sh, single quotes protect everything but themselves
static std::string shellQuote(const std::string& arg) {
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

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

std::string SysInteraction::replaceFile(const std::string& file_path, const std::string& content) {
    std::filesystem::path target(file_path);
    std::filesystem::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream file_stream(tmp, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            return "cannot open " + tmp.string() + " for writing";
        }
        file_stream << content;
        file_stream.flush();
        if (!file_stream) {
            file_stream.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return "cannot write " + tmp.string();
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::string reason = "cannot replace " + target.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return reason;
    }
    return "";
}

std::string SysInteraction::removeFile(const std::string& file_path) {
    std::error_code ec;
    std::filesystem::remove(file_path, ec);
    if (ec) {
        return "cannot remove " + file_path + ": " + ec.message();
    }
    return "";
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

std::string SysInteraction::writeTempFile(const std::string& name_prefix, const std::string& content) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }

    std::string pattern = (dir / (name_prefix + "XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        throw std::runtime_error("Failed to create temporary file in " + dir.string() +
                                 ": " + std::strerror(errno));
    }

    std::string path(name.data());
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            close(fd);
            unlink(path.c_str());
            throw std::runtime_error("Failed to write temporary file " + path + ": " + reason);
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        std::string reason = std::strerror(errno);
        unlink(path.c_str());
        throw std::runtime_error("Failed to close temporary file " + path + ": " + reason);
    }
    return path;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    // Build the full command string
    std::string full_command = command;
    for (const auto& arg : args) {
        full_command += " " + shellQuote(arg);
    }

    // Only stdout is captured, git's complaints are not part of the answer
    full_command += " 2>/dev/null";

    LOG_DEBUG("SysInteraction", "Executing: " + full_command);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    std::array<char, 128> buffer;
    std::string result;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    int exit_status = pclose(pipe.release());

    // pclose returns the wait status, extract the actual exit code
    if (exit_status != -1 && WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        exit_status = -1;
    }

    return {result, exit_status};
}

int SysInteraction::runCommand(const std::string& command, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::cout.flush();
    Logger::getInstance().flush();

    pid_t pid = fork();
    if (pid == 0) {
        execvp(command.c_str(), argv.data());
        std::perror(("execvp(" + command + ") failed").c_str());
        _exit(127);
    }

    if (pid < 0) {
        LOG_ERROR("SysInteraction", std::string("fork() failed: ") + std::strerror(errno));
        return -1;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG_ERROR("SysInteraction", std::string("waitpid() failed: ") + std::strerror(errno));
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace GitCC
