// =================================================================
// include/GitCC/SessionStateStore.hpp
// =================================================================
// Persists partial questionnaire answers between runs (the swap file).

#pragma once

#include "GitCC/AnswerSet.hpp"
#include "GitCC/SysInteraction.hpp"
#include <string>

namespace GitCC {

/**
 * @brief Outcome of reading the swap file
 */
enum class LoadStatus {
    RESTORED,   ///< Answers were read from the file
    MISSING,    ///< No swap file exists
    CORRUPT     ///< The file exists but could not be read or decoded
};

struct LoadOutcome {
    LoadStatus status = LoadStatus::MISSING;
    AnswerSet answers;
    std::string error;  ///< Reason for CORRUPT
};

/**
 * @brief Reads, writes and removes the swap file of one repository
 *
 * The file is a JSON object keyed by field name. Writes replace the file
 * as a whole through a temporary file and a rename. None of the public
 * operations throw, failures are reported through the return value and
 * the Logger.
 */
class SessionStateStore {
public:
    static constexpr const char* kFileName = ".git-cc.swp";
    static constexpr int kFormatVersion = 1;

    /**
     * @param file_path Location of the swap file
     */
    explicit SessionStateStore(const std::string& file_path);

    /**
     * @brief Read the swap file and report what happened
     */
    LoadOutcome tryLoad();

    /**
     * @brief Read the swap file, falling back to empty answers
     *
     * A missing or unreadable file yields a default AnswerSet.
     */
    AnswerSet load();

    /**
     * @brief Replace the swap file with the given answers
     * @return True on success, failures are logged as warnings
     */
    bool save(const AnswerSet& answers);

    /**
     * @brief Remove the swap file, a missing file is not an error
     * @return True if no swap file remains
     */
    bool clear();

    bool exists();

    const std::string& path() const { return m_file_path; }

    /**
     * @brief Encode answers in the swap file format
     */
    static std::string serialize(const AnswerSet& answers);

    /**
     * @brief Decode the swap file format
     *
     * Unknown keys are ignored and missing keys keep their default value.
     * A document that is not an object, or a known key holding a value of
     * the wrong type, yields CORRUPT.
     */
    static LoadOutcome deserialize(const std::string& content);

private:
    std::string m_file_path;
    SysInteraction m_sys;
    bool m_save_warned;
};

} // namespace GitCC
