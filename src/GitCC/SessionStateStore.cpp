// =================================================================
// src/GitCC/SessionStateStore.cpp
// =================================================================
// Implementation for the swap file store.

#include "GitCC/SessionStateStore.hpp"
#include "GitCC/Logger.hpp"
#include "nlohmann/json.hpp"
#include <stdexcept>

namespace GitCC {

namespace {

// Field tags of the swap file
const char* const kVersionKey = "version";
const char* const kCommitTypeKey = "commit_type";
const char* const kScopeKey = "scope";
const char* const kShortDescriptionKey = "short_description";
const char* const kLongDescriptionKey = "long_description";
const char* const kBreakingChangeKey = "breaking_change";
const char* const kBreakingChangeNoteKey = "breaking_change_note";

void readString(const nlohmann::json& doc, const char* key, std::string& target) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' is not a string");
    }
    target = it->get<std::string>();
}

void readBool(const nlohmann::json& doc, const char* key, bool& target) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    if (!it->is_boolean()) {
        throw std::runtime_error(std::string("field '") + key + "' is not a boolean");
    }
    target = it->get<bool>();
}

} // namespace

SessionStateStore::SessionStateStore(const std::string& file_path)
    : m_file_path(file_path), m_save_warned(false) {}

std::string SessionStateStore::serialize(const AnswerSet& answers) {
    nlohmann::json doc = {
        {kVersionKey, kFormatVersion},
        {kCommitTypeKey, answers.commit_type},
        {kScopeKey, answers.scope},
        {kShortDescriptionKey, answers.short_description},
        {kLongDescriptionKey, answers.long_description},
        {kBreakingChangeKey, answers.breaking_change},
        {kBreakingChangeNoteKey, answers.breaking_change_note}
    };
    return doc.dump(2);
}

LoadOutcome SessionStateStore::deserialize(const std::string& content) {
    LoadOutcome outcome;

    try {
        nlohmann::json doc = nlohmann::json::parse(content);
        if (!doc.is_object()) {
            outcome.status = LoadStatus::CORRUPT;
            outcome.error = "swap file is not a JSON object";
            return outcome;
        }

        AnswerSet answers;
        readString(doc, kCommitTypeKey, answers.commit_type);
        readString(doc, kScopeKey, answers.scope);
        readString(doc, kShortDescriptionKey, answers.short_description);
        readString(doc, kLongDescriptionKey, answers.long_description);
        readBool(doc, kBreakingChangeKey, answers.breaking_change);
        readString(doc, kBreakingChangeNoteKey, answers.breaking_change_note);

        outcome.status = LoadStatus::RESTORED;
        outcome.answers = answers;
    } catch (const nlohmann::json::exception& e) {
        outcome.status = LoadStatus::CORRUPT;
        outcome.error = e.what();
    } catch (const std::runtime_error& e) {
        outcome.status = LoadStatus::CORRUPT;
        outcome.error = e.what();
    }

    return outcome;
}

LoadOutcome SessionStateStore::tryLoad() {
    if (!m_sys.fileExists(m_file_path)) {
        return LoadOutcome{};
    }

    std::string content;
    try {
        content = m_sys.readFile(m_file_path);
    } catch (const std::runtime_error& e) {
        LoadOutcome outcome;
        outcome.status = LoadStatus::CORRUPT;
        outcome.error = e.what();
        return outcome;
    }

    return deserialize(content);
}

AnswerSet SessionStateStore::load() {
    LoadOutcome outcome = tryLoad();

    switch (outcome.status) {
        case LoadStatus::RESTORED:
            LOG_DEBUG("SessionStateStore", "Loaded previous answers from " + m_file_path);
            return outcome.answers;
        case LoadStatus::CORRUPT:
            Logger::getInstance().debug("SessionStateStore", "Ignoring unreadable swap file",
                                        m_file_path + ": " + outcome.error);
            break;
        case LoadStatus::MISSING:
            break;
    }
    return AnswerSet{};
}

bool SessionStateStore::save(const AnswerSet& answers) {
    std::string failure;
    try {
        failure = m_sys.replaceFile(m_file_path, serialize(answers));
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        // Warn once per store, a broken location fails for every question
        if (!m_save_warned) {
            Logger::getInstance().warning("SessionStateStore", "Could not save answers, this run cannot be resumed",
                                          failure);
            m_save_warned = true;
        } else {
            LOG_DEBUG("SessionStateStore", "Save failed again: " + failure);
        }
        return false;
    }
    return true;
}

bool SessionStateStore::clear() {
    std::string failure = m_sys.removeFile(m_file_path);
    if (!failure.empty()) {
        Logger::getInstance().warning("SessionStateStore", "Could not remove swap file", failure);
        return false;
    }
    return true;
}

bool SessionStateStore::exists() {
    return m_sys.fileExists(m_file_path);
}

} // namespace GitCC
