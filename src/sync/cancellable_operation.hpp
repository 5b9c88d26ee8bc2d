#pragma once

#include <QTimer>
#include <chrono>
#include <functional>
#include <memory>

namespace daybook::sync {

/**
 * Shared cancellation flag. Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<bool>(false)) {}

    [[nodiscard]] bool is_cancelled() const noexcept { return *cancelled_; }
    void cancel() noexcept { *cancelled_ = true; }

private:
    std::shared_ptr<bool> cancelled_;
};

/**
 * CancellableOperation - an asynchronous body with a timeout ceiling.
 *
 * The body receives a token and a `finished` callback. When the timeout
 * fires first the token is cancelled and `on_timeout` runs; results the
 * body delivers afterwards must be dropped by checking the token.
 * Destroying the operation cancels it.
 */
class CancellableOperation : public std::enable_shared_from_this<CancellableOperation> {
public:
    using Body = std::function<void(const CancellationToken& token, std::function<void()> finished)>;

    [[nodiscard]] static std::shared_ptr<CancellableOperation> start(
        Body body,
        std::chrono::milliseconds timeout,
        std::function<void()> on_timeout = {});

    CancellableOperation(std::chrono::milliseconds timeout, std::function<void()> on_timeout);
    ~CancellableOperation();

    CancellableOperation(const CancellableOperation&) = delete;
    CancellableOperation& operator=(const CancellableOperation&) = delete;

    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept { return token_.is_cancelled(); }
    [[nodiscard]] bool is_finished() const noexcept { return finished_; }
    [[nodiscard]] bool is_active() const noexcept { return !finished_ && !is_cancelled(); }
    [[nodiscard]] const CancellationToken& token() const noexcept { return token_; }

private:
    void finish();

    CancellationToken token_;
    QTimer timer_;
    std::chrono::milliseconds timeout_;
    std::function<void()> on_timeout_;
    bool finished_ = false;
};

} // namespace daybook::sync
