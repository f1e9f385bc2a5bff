/**
 * @file RecordRepository.hpp
 * @brief Interface for typed persistence of one kind of record.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "Habit.hpp"
#include "Note.hpp"
#include "RecordId.hpp"
#include "Reminder.hpp"
#include "Task.hpp"

namespace deskpal::domain {

/**
 * @class RecordRepository
 * @brief Abstract collection of records of one kind, keyed by id.
 *
 * Implementations serialize all operations on a collection and commit every
 * mutation durably before returning; a failed commit leaves the collection
 * unchanged.
 *
 * @tparam Record A record struct with a public `RecordId id` member.
 */
template <typename Record>
class RecordRepository {
public:
    using Mutation = std::function<void(Record&)>;
    using Predicate = std::function<bool(const Record&)>;

    virtual ~RecordRepository() = default;

    /**
     * @brief Stores a new record.
     * @param draft Record fields; its id is ignored and replaced.
     * @return The stored record with its newly assigned id.
     */
    virtual Record create(Record draft) = 0;

    /** @throws NotFoundError if no record has this id. */
    virtual Record get(RecordId id) const = 0;

    virtual std::optional<Record> find(RecordId id) const = 0;

    /** @brief All records in insertion order. */
    virtual std::vector<Record> list() const = 0;

    /**
     * @brief Applies `mutate` to the record and commits it. The id cannot be changed.
     * @throws NotFoundError if no record has this id.
     */
    virtual Record update(RecordId id, const Mutation& mutate) = 0;

    /** @throws NotFoundError if no record has this id. */
    virtual void remove(RecordId id) = 0;

    /**
     * @brief Atomically selects every record matching `match`, applies `mutate`
     *        to each and commits them in one write.
     * @return The mutated records, in insertion order.
     */
    virtual std::vector<Record> claim(const Predicate& match, const Mutation& mutate) = 0;
};

/**
 * @struct RecordRepositories
 * @brief The four collections making up the assistant's durable state.
 */
struct RecordRepositories {
    std::shared_ptr<RecordRepository<Task>> tasks;
    std::shared_ptr<RecordRepository<Habit>> habits;
    std::shared_ptr<RecordRepository<Note>> notes;
    std::shared_ptr<RecordRepository<Reminder>> reminders;
};

} // namespace deskpal::domain
