#include "notes/repository_factory.hpp"
#include "notes/envelope_repository.hpp"
#include "notes/image_sync.hpp"
#include "notes/local_note_repository.hpp"
#include "notes/synced_note_repository.hpp"

#include <QDebug>

namespace daybook::notes {

std::shared_ptr<NoteRepository> make_note_repository(const RepositoryDependencies& deps,
                                                     const config::SyncSettings& settings) {
    if (!deps.store || !deps.e2ee) {
        qWarning() << "NOTES: cannot build a note repository without a store and keys";
        return nullptr;
    }

    const bool synced = settings.enabled && deps.notes_gateway && deps.connectivity;
    if (!synced) {
        qInfo() << "NOTES: using local-only note repository";
        return std::make_shared<LocalNoteRepository>(deps.store, deps.e2ee, deps.clock);
    }

    EnvelopeRepository::Options options;
    options.refresh_dates_cooldown = settings.refresh_dates_cooldown;
    auto envelopes = std::make_shared<EnvelopeRepository>(
        deps.store, deps.notes_gateway, deps.connectivity, deps.clock, options);
    if (deps.images_gateway) {
        envelopes->set_image_sync(
            std::make_shared<ImageSyncService>(deps.store, deps.images_gateway, deps.clock));
    }
    qInfo() << "NOTES: using synced note repository";
    return std::make_shared<SyncedNoteRepository>(std::move(envelopes), deps.e2ee, deps.clock);
}

} // namespace daybook::notes
