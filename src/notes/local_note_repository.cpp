#include "notes/local_note_repository.hpp"
#include "notes/note_codec.hpp"

namespace daybook::notes {

LocalNoteRepository::LocalNoteRepository(std::shared_ptr<storage::LocalStore> store,
                                         std::shared_ptr<const crypto::E2eeService> e2ee,
                                         ClockFn clock)
    : store_(std::move(store)), e2ee_(std::move(e2ee)), clock_(std::move(clock)) {}

void LocalNoteRepository::get(const std::string& date,
                              Completion<Result<std::optional<Note>, RepositoryError>> done) {
    using R = Result<std::optional<Note>, RepositoryError>;
    auto record = store_->notes.get_record(date);
    if (record.is_err()) {
        done(R::err(RepositoryError::from(record.unwrap_err())));
        return;
    }
    const auto& found = record.unwrap();
    if (!found) {
        done(R::ok(std::nullopt));
        return;
    }
    done(open_note(*e2ee_, *found));
}

void LocalNoteRepository::save(const std::string& date,
                               const std::string& content,
                               const std::optional<HabitValues>& habits,
                               Completion<Result<void, RepositoryError>> done) {
    using R = Result<void, RepositoryError>;
    auto sealed = seal_note(*e2ee_, date, content, habits, clock_().to_iso_string());
    if (sealed.is_err()) {
        done(R::err(sealed.unwrap_err()));
        return;
    }
    auto written = store_->notes.put_record(sealed.unwrap());
    if (written.is_err()) {
        done(R::err(RepositoryError::from(written.unwrap_err())));
        return;
    }
    done(R::ok());
}

void LocalNoteRepository::remove(const std::string& date,
                                 Completion<Result<void, RepositoryError>> done) {
    using R = Result<void, RepositoryError>;
    auto removed = store_->notes.remove(date);
    if (removed.is_err()) {
        done(R::err(RepositoryError::from(removed.unwrap_err())));
        return;
    }
    done(R::ok());
}

void LocalNoteRepository::get_all_dates(
    Completion<Result<std::vector<std::string>, RepositoryError>> done) {
    using R = Result<std::vector<std::string>, RepositoryError>;
    auto dates = store_->notes.all_dates();
    if (dates.is_err()) {
        done(R::err(RepositoryError::from(dates.unwrap_err())));
        return;
    }
    done(R::ok(std::move(dates).unwrap()));
}

} // namespace daybook::notes
