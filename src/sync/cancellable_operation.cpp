#include "sync/cancellable_operation.hpp"

#include <QDebug>

namespace daybook::sync {

CancellableOperation::CancellableOperation(std::chrono::milliseconds timeout,
                                           std::function<void()> on_timeout)
    : timeout_(timeout), on_timeout_(std::move(on_timeout)) {
    timer_.setSingleShot(true);
    QObject::connect(&timer_, &QTimer::timeout, [this] {
        if (finished_ || is_cancelled()) return;
        qWarning() << "SYNC: operation timed out after" << timeout_.count() << "ms";
        token_.cancel();
        if (on_timeout_) on_timeout_();
    });
}

CancellableOperation::~CancellableOperation() {
    token_.cancel();
}

std::shared_ptr<CancellableOperation> CancellableOperation::start(
    Body body,
    std::chrono::milliseconds timeout,
    std::function<void()> on_timeout) {
    auto op = std::make_shared<CancellableOperation>(timeout, std::move(on_timeout));
    op->timer_.start(timeout);

    std::weak_ptr<CancellableOperation> weak = op;
    body(op->token_, [weak] {
        if (auto self = weak.lock()) {
            self->finish();
        }
    });
    return op;
}

void CancellableOperation::cancel() {
    timer_.stop();
    token_.cancel();
}

void CancellableOperation::finish() {
    finished_ = true;
    timer_.stop();
}

} // namespace daybook::sync
