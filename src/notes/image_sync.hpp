#pragma once

#include "core/completion.hpp"
#include "core/errors.hpp"
#include "core/image.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/remote_gateway.hpp"
#include "storage/local_store.hpp"
#include <memory>
#include <vector>

namespace daybook::notes {

/**
 * ImageSyncService - pushes pending image uploads and deletions.
 *
 * Runs as one step of a note sync. Stops at the first failure; items
 * already processed keep their new state.
 */
class ImageSyncService : public std::enable_shared_from_this<ImageSyncService> {
public:
    ImageSyncService(std::shared_ptr<storage::LocalStore> store,
                     std::shared_ptr<network::RemoteImagesGateway> gateway,
                     ClockFn clock = system_clock());

    void sync(Completion<Result<void, SyncError>> done);

private:
    void process(std::shared_ptr<std::vector<ImageMeta>> pending,
                 size_t index,
                 Completion<Result<void, SyncError>> done);

    std::shared_ptr<storage::LocalStore> store_;
    std::shared_ptr<network::RemoteImagesGateway> gateway_;
    ClockFn clock_;
};

} // namespace daybook::notes
