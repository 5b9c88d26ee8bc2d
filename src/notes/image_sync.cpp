#include "notes/image_sync.hpp"

#include <QDebug>

namespace daybook::notes {

namespace {

SyncError local_failure(const Error& e) {
    return SyncError{SyncErrorKind::Unknown, "Local image store: " + e.message};
}

} // namespace

ImageSyncService::ImageSyncService(std::shared_ptr<storage::LocalStore> store,
                                   std::shared_ptr<network::RemoteImagesGateway> gateway,
                                   ClockFn clock)
    : store_(std::move(store)), gateway_(std::move(gateway)), clock_(std::move(clock)) {}

void ImageSyncService::sync(Completion<Result<void, SyncError>> done) {
    auto pending = store_->images.pending_metas();
    if (pending.is_err()) {
        done(Result<void, SyncError>::err(local_failure(pending.unwrap_err())));
        return;
    }
    auto list = std::make_shared<std::vector<ImageMeta>>(std::move(pending).unwrap());
    process(std::move(list), 0, std::move(done));
}

void ImageSyncService::process(std::shared_ptr<std::vector<ImageMeta>> pending,
                               size_t index,
                               Completion<Result<void, SyncError>> done) {
    using R = Result<void, SyncError>;
    if (index >= pending->size()) {
        done(R::ok());
        return;
    }

    const auto meta = (*pending)[index];
    auto self = shared_from_this();
    auto next = [self, pending, index, done](R result) {
        if (result.is_err()) {
            done(result);
            return;
        }
        self->process(pending, index + 1, done);
    };

    if (meta.pending_op == ImagePendingOp::Delete) {
        gateway_->delete_image(meta.id, [self, meta, next](Result<void, SyncError> result) {
            if (result.is_err()) {
                next(result);
                return;
            }
            auto removed = self->store_->images.remove(meta.id);
            next(removed.is_err() ? R::err(local_failure(removed.unwrap_err())) : R::ok());
        });
        return;
    }

    auto record = store_->images.get_record(meta.id);
    if (record.is_err()) {
        next(R::err(local_failure(record.unwrap_err())));
        return;
    }
    if (!record.unwrap()) {
        qWarning() << "SYNC: image" << QString::fromStdString(meta.id)
                   << "has no blob, dropping upload";
        auto updated = meta;
        updated.pending_op.reset();
        auto written = store_->images.put_meta(updated);
        next(written.is_err() ? R::err(local_failure(written.unwrap_err())) : R::ok());
        return;
    }

    gateway_->upload_image(*record.unwrap(), meta,
        [self, meta, next](Result<network::RemoteImageRef, SyncError> result) {
            if (result.is_err()) {
                next(R::err(result.unwrap_err()));
                return;
            }
            // The image may have been removed while the upload was in flight.
            auto current = self->store_->images.get_meta(meta.id);
            if (current.is_err()) {
                next(R::err(local_failure(current.unwrap_err())));
                return;
            }
            auto latest = current.unwrap();
            if (!latest) {
                next(R::ok());
                return;
            }
            latest->remote_path = result.unwrap().remote_path;
            latest->server_updated_at = result.unwrap().server_updated_at;
            if (latest->pending_op == ImagePendingOp::Upload) {
                latest->pending_op.reset();
            }
            auto written = self->store_->images.put_meta(*latest);
            next(written.is_err() ? R::err(local_failure(written.unwrap_err())) : R::ok());
        });
}

} // namespace daybook::notes
