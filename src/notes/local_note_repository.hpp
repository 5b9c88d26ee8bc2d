#pragma once

#include "notes/note_repository.hpp"
#include "crypto/e2ee_service.hpp"
#include "storage/local_store.hpp"
#include "core/types.hpp"
#include <memory>

namespace daybook::notes {

/**
 * LocalNoteRepository - encrypted notes on this device only.
 *
 * Has no sync capability; completions run before the call returns.
 */
class LocalNoteRepository : public NoteRepository {
public:
    LocalNoteRepository(std::shared_ptr<storage::LocalStore> store,
                        std::shared_ptr<const crypto::E2eeService> e2ee,
                        ClockFn clock = system_clock());

    void get(const std::string& date,
             Completion<Result<std::optional<Note>, RepositoryError>> done) override;
    void save(const std::string& date,
              const std::string& content,
              const std::optional<HabitValues>& habits,
              Completion<Result<void, RepositoryError>> done) override;
    void remove(const std::string& date,
                Completion<Result<void, RepositoryError>> done) override;
    void get_all_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) override;

private:
    std::shared_ptr<storage::LocalStore> store_;
    std::shared_ptr<const crypto::E2eeService> e2ee_;
    ClockFn clock_;
};

} // namespace daybook::notes
