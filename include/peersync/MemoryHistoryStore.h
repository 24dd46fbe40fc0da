/**
 * @file MemoryHistoryStore.h
 * @brief In-memory HistoryStore
 */

#pragma once

#include "StorageInterfaces.h"

#include <atomic>
#include <map>
#include <mutex>

namespace PeerSync {

/**
 * @class MemoryHistoryStore
 * @brief HistoryStore kept in ordered maps keyed by id
 *
 * Used by the loopback demo and the test suite. Ids start at 1 and are
 * never reused. setWriteFailure() makes every mutating call fail, to
 * exercise the receiver's failure accounting.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class MemoryHistoryStore : public HistoryStore {
public:
    MemoryHistoryStore() = default;

    bool getAllHistory(std::vector<HistoryRecord>& out, std::string& errorMsg) override;
    bool getHistoryByIds(const std::vector<RecordId>& ids,
                         std::vector<HistoryRecord>& out,
                         std::string& errorMsg) override;
    bool hasHistoryByUuid(const std::string& uuid, bool& exists, std::string& errorMsg) override;
    bool addHistoryWithUuid(const HistoryRecord& record, RecordId& newId, std::string& errorMsg) override;
    bool updateHistoryImages(RecordId id, const std::vector<StoredImage>& images, std::string& errorMsg) override;
    bool updateHistoryVideo(RecordId id, const StoredVideo& video, std::string& errorMsg) override;

    bool getAllCharacters(std::vector<CharacterRecord>& out, std::string& errorMsg) override;
    bool getCharacterById(RecordId id, CharacterRecord& out, bool& found, std::string& errorMsg) override;
    bool getCharacterByName(const std::string& name,
                            CharacterRecord& out,
                            bool& found,
                            std::string& errorMsg) override;
    bool addCharacter(const CharacterRecord& character, RecordId& newId, std::string& errorMsg) override;
    bool updateCharacterImage(RecordId id, const std::string& imagePath, std::string& errorMsg) override;

    /// Insert a fully formed record (seeding); its id is reassigned
    RecordId insertHistory(HistoryRecord record);

    /// Insert a fully formed character (seeding); its id is reassigned
    RecordId insertCharacter(CharacterRecord character);

    size_t historyCount() const;
    size_t characterCount() const;

    void setWriteFailure(bool fail) { m_failWrites = fail; }

private:
    bool checkWritable(std::string& errorMsg) const;

    mutable std::mutex m_mutex;
    std::map<RecordId, HistoryRecord> m_history;
    std::map<RecordId, CharacterRecord> m_characters;
    RecordId m_nextHistoryId = 1;
    RecordId m_nextCharacterId = 1;
    std::atomic<bool> m_failWrites{false};
};

}  // namespace PeerSync
