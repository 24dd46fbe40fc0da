/**
 * @file MemoryHistoryStore.cpp
 * @brief In-memory HistoryStore implementation
 */

#include "peersync/MemoryHistoryStore.h"

namespace PeerSync {

bool MemoryHistoryStore::checkWritable(std::string& errorMsg) const {
    if (m_failWrites) {
        errorMsg = "History store is read-only";
        return false;
    }
    return true;
}

//=============================================================================
// History
//=============================================================================

bool MemoryHistoryStore::getAllHistory(std::vector<HistoryRecord>& out, std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    out.reserve(m_history.size());
    for (const auto& entry : m_history) {
        out.push_back(entry.second);
    }
    return true;
}

bool MemoryHistoryStore::getHistoryByIds(const std::vector<RecordId>& ids,
                                         std::vector<HistoryRecord>& out,
                                         std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    for (RecordId id : ids) {
        auto it = m_history.find(id);
        if (it != m_history.end()) {
            out.push_back(it->second);
        }
    }
    return true;
}

bool MemoryHistoryStore::hasHistoryByUuid(const std::string& uuid, bool& exists, std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    exists = false;
    for (const auto& entry : m_history) {
        if (entry.second.uuid == uuid) {
            exists = true;
            break;
        }
    }
    return true;
}

bool MemoryHistoryStore::addHistoryWithUuid(const HistoryRecord& record, RecordId& newId, std::string& errorMsg) {
    if (!checkWritable(errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    HistoryRecord stored = record;
    stored.id = m_nextHistoryId++;
    stored.images.clear();
    stored.hasVideo = false;
    stored.video = StoredVideo{};
    newId = stored.id;
    m_history.emplace(stored.id, std::move(stored));
    return true;
}

bool MemoryHistoryStore::updateHistoryImages(RecordId id,
                                             const std::vector<StoredImage>& images,
                                             std::string& errorMsg) {
    if (!checkWritable(errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(id);
    if (it == m_history.end()) {
        errorMsg = "No history record with id " + std::to_string(id);
        return false;
    }
    it->second.images = images;
    return true;
}

bool MemoryHistoryStore::updateHistoryVideo(RecordId id, const StoredVideo& video, std::string& errorMsg) {
    if (!checkWritable(errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(id);
    if (it == m_history.end()) {
        errorMsg = "No history record with id " + std::to_string(id);
        return false;
    }
    it->second.hasVideo = true;
    it->second.video = video;
    return true;
}

RecordId MemoryHistoryStore::insertHistory(HistoryRecord record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    record.id = m_nextHistoryId++;
    const RecordId id = record.id;
    m_history.emplace(id, std::move(record));
    return id;
}

size_t MemoryHistoryStore::historyCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

//=============================================================================
// Characters
//=============================================================================

bool MemoryHistoryStore::getAllCharacters(std::vector<CharacterRecord>& out, std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    out.reserve(m_characters.size());
    for (const auto& entry : m_characters) {
        out.push_back(entry.second);
    }
    return true;
}

bool MemoryHistoryStore::getCharacterById(RecordId id, CharacterRecord& out, bool& found, std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_characters.find(id);
    found = (it != m_characters.end());
    if (found) {
        out = it->second;
    }
    return true;
}

bool MemoryHistoryStore::getCharacterByName(const std::string& name,
                                            CharacterRecord& out,
                                            bool& found,
                                            std::string& errorMsg) {
    (void)errorMsg;
    std::lock_guard<std::mutex> lock(m_mutex);
    found = false;
    for (const auto& entry : m_characters) {
        if (entry.second.name == name) {
            out = entry.second;
            found = true;
            break;
        }
    }
    return true;
}

bool MemoryHistoryStore::addCharacter(const CharacterRecord& character, RecordId& newId, std::string& errorMsg) {
    if (!checkWritable(errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    CharacterRecord stored = character;
    stored.id = m_nextCharacterId++;
    newId = stored.id;
    m_characters.emplace(stored.id, std::move(stored));
    return true;
}

bool MemoryHistoryStore::updateCharacterImage(RecordId id, const std::string& imagePath, std::string& errorMsg) {
    if (!checkWritable(errorMsg)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_characters.find(id);
    if (it == m_characters.end()) {
        errorMsg = "No character with id " + std::to_string(id);
        return false;
    }
    it->second.imagePath = imagePath;
    return true;
}

RecordId MemoryHistoryStore::insertCharacter(CharacterRecord character) {
    std::lock_guard<std::mutex> lock(m_mutex);
    character.id = m_nextCharacterId++;
    const RecordId id = character.id;
    m_characters.emplace(id, std::move(character));
    return id;
}

size_t MemoryHistoryStore::characterCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_characters.size();
}

}  // namespace PeerSync
