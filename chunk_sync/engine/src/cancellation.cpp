#include "cancellation.hpp"

#include "errors.hpp"

namespace chunksync::engine {

void CancellationToken::throw_if_requested() const {
    if (requested()) {
        throw CancelledError();
    }
}

CancellationToken& process_cancellation() {
    static CancellationToken token;
    return token;
}

}  // namespace chunksync::engine
