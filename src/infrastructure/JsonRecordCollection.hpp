/**
 * @file JsonRecordCollection.hpp
 * @brief File system implementation of RecordRepository: one JSON document per record kind.
 */

#pragma once

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/AssistantErrors.hpp"
#include "domain/RecordRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RecordSerialization.hpp"

namespace deskpal::infrastructure {

/// Version tag written into every collection document.
constexpr int kDocumentVersion = 1;

/**
 * @class JsonRecordCollection
 * @brief Keeps one collection in memory and rewrites its whole document on every mutation.
 *
 * Document layout:
 * @code
 * { "version": 1, "next_id": 4, "records": [ { "id": 1, ... }, ... ] }
 * @endcode
 * `next_id` is persisted so deleted ids are never handed out again, even
 * after a restart. A mutation is prepared on a copy, written through the
 * PersistenceService, and only swapped into memory once the write succeeded.
 * After a failed load every mutation is refused until a load succeeds, so a
 * damaged document is never overwritten and its ids are never issued again.
 */
template <typename Record>
class JsonRecordCollection : public domain::RecordRepository<Record> {
public:
    using Traits = RecordTraits<Record>;
    using typename domain::RecordRepository<Record>::Mutation;
    using typename domain::RecordRepository<Record>::Predicate;

    JsonRecordCollection(std::filesystem::path documentPath, std::shared_ptr<PersistenceService> persistence)
        : m_documentPath(std::move(documentPath)), m_persistence(std::move(persistence)) {}

    const std::filesystem::path& documentPath() const { return m_documentPath; }

    /**
     * @brief Reads the document from disk, replacing the in-memory state.
     *
     * A missing document yields an empty collection.
     * @throws domain::CorruptStoreError if the document is malformed; the collection is then left
     *         empty and read-only.
     * @throws domain::StorageError if the document exists but cannot be read; same effect.
     */
    void load() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.clear();
        m_nextId = 1;
        try {
            readDocument();
            m_loadFailure = nullptr;
        } catch (const std::exception&) {
            m_loadFailure = std::current_exception();
            throw;
        }
    }

    Record create(Record draft) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        requireWritable();
        draft.id = m_nextId;
        std::vector<Record> next = m_records;
        next.push_back(draft);
        commit(std::move(next), m_nextId + 1);
        return draft;
    }

    Record get(domain::RecordId id) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = locate(m_records, id);
        if (it == m_records.end()) {
            throw notFound(id);
        }
        return *it;
    }

    std::optional<Record> find(domain::RecordId id) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = locate(m_records, id);
        if (it == m_records.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<Record> list() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records;
    }

    Record update(domain::RecordId id, const Mutation& mutate) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        requireWritable();
        std::vector<Record> next = m_records;
        auto it = locate(next, id);
        if (it == next.end()) {
            throw notFound(id);
        }
        mutate(*it);
        it->id = id;
        Record updated = *it;
        commit(std::move(next), m_nextId);
        return updated;
    }

    void remove(domain::RecordId id) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        requireWritable();
        std::vector<Record> next = m_records;
        auto it = locate(next, id);
        if (it == next.end()) {
            throw notFound(id);
        }
        next.erase(it);
        commit(std::move(next), m_nextId);
    }

    std::vector<Record> claim(const Predicate& match, const Mutation& mutate) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        requireWritable();
        std::vector<Record> claimed;
        std::vector<Record> next = m_records;
        for (auto& record : next) {
            if (!match(record)) continue;
            domain::RecordId id = record.id;
            mutate(record);
            record.id = id;
            claimed.push_back(record);
        }
        if (!claimed.empty()) {
            commit(std::move(next), m_nextId);
        }
        return claimed;
    }

private:
    template <typename Vec>
    static auto locate(Vec& records, domain::RecordId id) {
        return std::find_if(records.begin(), records.end(),
                            [id](const Record& r) { return r.id == id; });
    }

    domain::NotFoundError notFound(domain::RecordId id) const {
        return domain::NotFoundError(std::string(Traits::Kind) + " " + std::to_string(id) + " not found");
    }

    // Caller holds m_mutex.
    void readDocument() {
        std::error_code ec;
        bool present = std::filesystem::exists(m_documentPath, ec);
        if (ec) {
            throw domain::StorageError("Cannot access " + m_documentPath.string() + ": " + ec.message());
        }
        if (!present) {
            return;
        }

        std::ifstream inFile(m_documentPath, std::ios::binary);
        if (!inFile) {
            throw domain::StorageError("Cannot read " + m_documentPath.string());
        }
        std::stringstream buffer;
        buffer << inFile.rdbuf();

        std::vector<Record> records;
        domain::RecordId nextId = 1;
        try {
            auto doc = nlohmann::json::parse(buffer.str());
            decodeDocument(doc, records, nextId);
        } catch (const std::exception& e) {
            std::cerr << "[RecordCollection] Corrupt document " << m_documentPath << ": " << e.what() << std::endl;
            throw domain::CorruptStoreError(m_documentPath.string(), e.what());
        }

        m_records = std::move(records);
        m_nextId = nextId;
    }

    // Caller holds m_mutex.
    void requireWritable() const {
        if (m_loadFailure) {
            std::rethrow_exception(m_loadFailure);
        }
    }

    // Caller holds m_mutex. Memory is only updated after the document is on disk.
    void commit(std::vector<Record> next, domain::RecordId nextId) {
        nlohmann::json records = nlohmann::json::array();
        for (const auto& record : next) {
            records.push_back(Traits::encode(record));
        }
        nlohmann::json doc = {
            {"version", kDocumentVersion},
            {"next_id", nextId},
            {"records", records}
        };

        m_persistence->saveText(m_documentPath, doc.dump(4));

        m_records = std::move(next);
        m_nextId = nextId;
    }

    static void decodeDocument(const nlohmann::json& doc, std::vector<Record>& records, domain::RecordId& nextId) {
        if (!doc.is_object()) {
            throw std::invalid_argument("document is not an object");
        }
        int version = doc.at("version").get<int>();
        if (version != kDocumentVersion) {
            throw std::invalid_argument("unsupported document version " + std::to_string(version));
        }
        const auto& entries = doc.at("records");
        if (!entries.is_array()) {
            throw std::invalid_argument("records is not an array");
        }

        std::set<domain::RecordId> seen;
        domain::RecordId highest = 0;
        for (const auto& entry : entries) {
            Record record = Traits::decode(entry);
            if (record.id == 0) {
                throw std::invalid_argument("record with id 0");
            }
            if (!seen.insert(record.id).second) {
                throw std::invalid_argument("duplicate id " + std::to_string(record.id));
            }
            highest = std::max(highest, record.id);
            records.push_back(std::move(record));
        }

        if (!doc.at("next_id").is_number_unsigned()) {
            throw std::invalid_argument("next_id is not an unsigned integer");
        }
        nextId = doc.at("next_id").get<domain::RecordId>();
        if (nextId <= highest) {
            throw std::invalid_argument("next_id " + std::to_string(nextId) +
                                        " does not exceed stored id " + std::to_string(highest));
        }
    }

    std::filesystem::path m_documentPath;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_mutex;
    std::vector<Record> m_records;
    domain::RecordId m_nextId = 1;
    std::exception_ptr m_loadFailure; ///< Set while the last load failed.
};

} // namespace deskpal::infrastructure
