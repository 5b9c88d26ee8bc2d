#pragma once

#include <functional>

namespace daybook {

/**
 * Continuation for an operation that crosses an I/O boundary.
 *
 * Implementations backed by local storage may invoke it before returning;
 * remote implementations invoke it later from the event loop. Callers must
 * not assume either.
 */
template<typename T>
using Completion = std::function<void(T)>;

} // namespace daybook
