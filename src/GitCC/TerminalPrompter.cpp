// =================================================================
// src/GitCC/TerminalPrompter.cpp
// =================================================================
// Implementation for the line-oriented prompts.

#include "GitCC/TerminalPrompter.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GitCC {

// Helper function to trim whitespace from both ends of a string.
static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

std::string TerminalPrompter::readLine(const std::string& label) {
    std::string line;
    if (!std::getline(m_in, line)) {
        m_out << std::endl;
        throw PromptCancelled("input closed while asking for " + label);
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

int TerminalPrompter::parseSelection(const std::string& input,
                                     const std::vector<std::string>& options) {
    // Exact option text wins over a number, so numeric scopes stay selectable
    auto it = std::find(options.begin(), options.end(), input);
    if (it != options.end()) {
        return static_cast<int>(it - options.begin());
    }

    if (input.empty() || !std::all_of(input.begin(), input.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    if (input.size() > 9) {
        return -1;
    }

    int number = std::stoi(input);
    if (number < 1 || number > static_cast<int>(options.size())) {
        return -1;
    }
    return number - 1;
}

std::string TerminalPrompter::select(const std::string& label,
                                     const std::vector<std::string>& options,
                                     const std::string& default_option) {
    if (options.empty()) {
        throw std::invalid_argument("no options to choose from for " + label);
    }

    bool has_default = std::find(options.begin(), options.end(), default_option) != options.end();

    m_out << "? " << label << std::endl;
    for (size_t i = 0; i < options.size(); ++i) {
        bool is_default = has_default && options[i] == default_option;
        m_out << (is_default ? "> " : "  ") << (i + 1) << ") " << options[i] << std::endl;
    }

    while (true) {
        m_out << "Select [1-" << options.size();
        if (has_default) {
            m_out << ", Enter for " << default_option;
        }
        m_out << "]: ";
        m_out.flush();

        std::string input = trim(readLine(label));
        if (input.empty()) {
            if (has_default) {
                return default_option;
            }
            m_out << "Please choose one of the options." << std::endl;
            continue;
        }

        int index = parseSelection(input, options);
        if (index >= 0) {
            return options[static_cast<size_t>(index)];
        }
        m_out << "'" << input << "' is not one of the options." << std::endl;
    }
}

std::string TerminalPrompter::textInput(const std::string& label,
                                        const std::string& default_value) {
    m_out << "? " << label;
    if (!default_value.empty()) {
        m_out << " [" << default_value << "]";
    }
    m_out << ": ";
    m_out.flush();

    std::string input = readLine(label);
    if (trim(input).empty()) {
        return default_value;
    }
    if (trim(input) == kClearToken) {
        return "";
    }
    return input;
}

std::string TerminalPrompter::multiLineInput(const std::string& label,
                                             const std::string& default_value) {
    m_out << "? " << label << " (end with a line containing only '" << kEndOfTextToken
          << "', '" << kClearToken << "' to clear)" << std::endl;
    if (!default_value.empty()) {
        m_out << "  current:" << std::endl;
        std::string::size_type start = 0;
        while (start <= default_value.size()) {
            std::string::size_type end = default_value.find('\n', start);
            if (end == std::string::npos) {
                end = default_value.size();
            }
            m_out << "  | " << default_value.substr(start, end - start) << std::endl;
            start = end + 1;
        }
        m_out << "  (enter '" << kEndOfTextToken << "' right away to keep it)" << std::endl;
    }

    std::vector<std::string> lines;
    std::string line;
    while (true) {
        if (!std::getline(m_in, line)) {
            if (lines.empty()) {
                m_out << std::endl;
                throw PromptCancelled("input closed while asking for " + label);
            }
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line == kEndOfTextToken) {
            break;
        }
        lines.push_back(line);
    }

    if (lines.empty()) {
        return default_value;
    }
    if (lines.size() == 1 && trim(lines.front()) == kClearToken) {
        return "";
    }

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

bool TerminalPrompter::confirm(const std::string& label, bool default_value) {
    while (true) {
        m_out << "? " << label << (default_value ? " [Y/n]: " : " [y/N]: ");
        m_out.flush();

        std::string input = toLower(trim(readLine(label)));
        if (input.empty()) {
            return default_value;
        }
        if (input == "y" || input == "yes") {
            return true;
        }
        if (input == "n" || input == "no") {
            return false;
        }
        m_out << "Please answer y or n." << std::endl;
    }
}

} // namespace GitCC
