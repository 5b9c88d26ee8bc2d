#pragma once

#include "config/sync_settings.hpp"
#include "core/types.hpp"
#include "crypto/e2ee_service.hpp"
#include "network/connectivity.hpp"
#include "network/remote_gateway.hpp"
#include "notes/note_repository.hpp"
#include "storage/local_store.hpp"
#include <memory>

namespace daybook::notes {

/**
 * What a note repository is built from. `notes_gateway` is empty while
 * signed out; `images_gateway` is optional even when signed in.
 */
struct RepositoryDependencies {
    std::shared_ptr<storage::LocalStore> store;
    std::shared_ptr<crypto::E2eeService> e2ee;
    std::shared_ptr<network::RemoteNotesGateway> notes_gateway;
    std::shared_ptr<network::RemoteImagesGateway> images_gateway;
    std::shared_ptr<network::Connectivity> connectivity;
    ClockFn clock = system_clock();
};

/**
 * A SyncedNoteRepository when sync is enabled and a remote account is
 * available, a LocalNoteRepository otherwise. Timing comes from
 * `settings`. Returns nullptr when the store or the E2EE service is missing.
 */
[[nodiscard]] std::shared_ptr<NoteRepository> make_note_repository(
    const RepositoryDependencies& deps, const config::SyncSettings& settings);

} // namespace daybook::notes
