#pragma once

#include "notes/note_repository.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace daybook::testing {

/**
 * NoteRepository whose writes settle only when the test releases them.
 * Reads answer inline from the writes settled so far.
 */
class DeferredNoteRepository : public notes::NoteRepository {
public:
    struct Write {
        std::string date;
        std::optional<std::string> content;  // nullopt for a remove
    };

    void get(const std::string& date,
             Completion<Result<std::optional<Note>, RepositoryError>> done) override {
        using R = Result<std::optional<Note>, RepositoryError>;
        auto it = notes_.find(date);
        if (it == notes_.end()) {
            done(R::ok(std::nullopt));
            return;
        }
        done(R::ok(Note{date, it->second, std::nullopt, "2026-05-01T00:00:00.000Z"}));
    }

    void save(const std::string& date, const std::string& content,
              const std::optional<HabitValues>&,
              Completion<Result<void, RepositoryError>> done) override {
        begin(Write{date, content}, std::move(done));
    }

    void remove(const std::string& date, Completion<Result<void, RepositoryError>> done) override {
        begin(Write{date, std::nullopt}, std::move(done));
    }

    void get_all_dates(
        Completion<Result<std::vector<std::string>, RepositoryError>> done) override {
        std::vector<std::string> dates;
        for (const auto& [date, content] : notes_) dates.push_back(date);
        done(Result<std::vector<std::string>, RepositoryError>::ok(std::move(dates)));
    }

    /**
     * Settle the oldest write; a failure leaves the stored note untouched.
     * Returns false when nothing is pending.
     */
    bool release_next(std::optional<RepositoryError> failure = std::nullopt) {
        if (pending_.empty()) return false;
        auto next = std::move(pending_.front());
        pending_.pop_front();
        --in_flight_;

        if (failure) {
            next.done(Result<void, RepositoryError>::err(std::move(*failure)));
            return true;
        }
        if (next.write.content) {
            notes_[next.write.date] = *next.write.content;
        } else {
            notes_.erase(next.write.date);
        }
        next.done(Result<void, RepositoryError>::ok());
        return true;
    }

    // Also settles writes issued while releasing.
    void release_all() {
        while (release_next()) {}
    }

    [[nodiscard]] size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] int max_in_flight() const noexcept { return max_in_flight_; }
    [[nodiscard]] const std::vector<Write>& issued() const noexcept { return issued_; }

    [[nodiscard]] int writes_of(const std::string& date, const std::string& content) const {
        return static_cast<int>(std::count_if(issued_.begin(), issued_.end(), [&](const Write& w) {
            return w.date == date && w.content == content;
        }));
    }

    [[nodiscard]] std::optional<std::string> stored(const std::string& date) const {
        auto it = notes_.find(date);
        if (it == notes_.end()) return std::nullopt;
        return it->second;
    }

private:
    struct Pending {
        Write write;
        Completion<Result<void, RepositoryError>> done;
    };

    void begin(Write write, Completion<Result<void, RepositoryError>> done) {
        issued_.push_back(write);
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        pending_.push_back(Pending{std::move(write), std::move(done)});
    }

    std::map<std::string, std::string> notes_;
    std::deque<Pending> pending_;
    std::vector<Write> issued_;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

} // namespace daybook::testing
