#pragma once

#include "config/sync_settings.hpp"
#include "core/observer.hpp"
#include "network/connectivity.hpp"
#include "notes/local_content_machine.hpp"
#include "notes/note_repository.hpp"
#include "notes/remote_sync_machine.hpp"
#include "notes/save_queue.hpp"
#include "sync/cancellable_operation.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <cstdint>
#include <memory>

namespace daybook::notes {

/**
 * NoteContentController - editing session for the active date.
 *
 * Runs the local content lifecycle (load, debounced save, flush) and the
 * remote reconciliation for the same date side by side. Changing the
 * date or the repository flushes the pending edit of the old context
 * before the new one loads; destruction flushes too.
 */
class NoteContentController : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString date READ date WRITE setDate NOTIFY dateChanged)
    Q_PROPERTY(QString content READ content WRITE setContent NOTIFY contentChanged)
    Q_PROPERTY(bool hasEdits READ hasEdits NOTIFY hasEditsChanged)
    Q_PROPERTY(bool isLoading READ isLoading NOTIFY isLoadingChanged)
    Q_PROPERTY(bool isSaving READ isSaving NOTIFY isSavingChanged)
    Q_PROPERTY(bool isOfflineStub READ isOfflineStub NOTIFY isOfflineStubChanged)
    Q_PROPERTY(QString error READ error NOTIFY errorChanged)

public:
    NoteContentController(std::shared_ptr<network::Connectivity> connectivity,
                          config::SyncSettings settings,
                          QObject* parent = nullptr);
    ~NoteContentController() override;

    [[nodiscard]] QString date() const { return date_; }
    [[nodiscard]] QString content() const { return QString::fromStdString(local_.content); }
    [[nodiscard]] bool hasEdits() const noexcept { return local_.has_edits; }
    [[nodiscard]] bool isLoading() const noexcept { return local_.phase == LocalPhase::Loading; }
    [[nodiscard]] bool isSaving() const noexcept;
    [[nodiscard]] bool isOfflineStub() const { return is_known_remote_only(remote_); }
    [[nodiscard]] QString error() const;

    [[nodiscard]] const LocalContentState& localState() const noexcept { return local_; }
    [[nodiscard]] const RemoteSyncState& remoteState() const noexcept { return remote_; }

    void setRepository(std::shared_ptr<NoteRepository> repository);
    void setDate(const QString& date);
    void setContent(const QString& content);

    /**
     * Persist pending edits now instead of waiting for the debounce.
     */
    Q_INVOKABLE void flush();

    /**
     * Refresh the active date from the remote store again, e.g. after a
     * change notification. Local edits still win.
     */
    Q_INVOKABLE void forceRefresh();

signals:
    void dateChanged();
    void contentChanged();
    void hasEditsChanged();
    void isLoadingChanged();
    void isSavingChanged();
    void isOfflineStubChanged();
    void errorChanged();
    void noteSaved(const QString& date, bool isEmpty);
    void loadFailed(const QString& date, const QString& message);
    void saveFailed(const QString& date, const QString& message);

private:
    void restart();
    void dispatch_local(const LocalContentEvent& event);
    void dispatch_remote(const RemoteSyncEvent& event);
    void sync_remote_inputs();
    void emit_local_changes(const LocalContentState& previous);

    void run(const local_effect::StartLoad& effect);
    void run(const local_effect::EnqueueSave& effect);
    void run(const remote_effect::CheckRemoteCache& effect);
    void run(const remote_effect::StartRefresh& effect);

    std::shared_ptr<network::Connectivity> connectivity_;
    config::SyncSettings settings_;
    std::shared_ptr<NoteRepository> repository_;
    std::shared_ptr<SaveQueue> save_queue_;
    Subscription connectivity_sub_;
    QTimer save_timer_;
    std::shared_ptr<sync::CancellableOperation> refresh_op_;

    QString date_;
    LocalContentState local_;
    RemoteSyncState remote_;
    uint64_t load_seq_ = 0;
    bool tearing_down_ = false;
};

} // namespace daybook::notes
