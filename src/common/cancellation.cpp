#include "common/cancellation.hpp"

namespace grader {

void cancellation_token::cancel() {
    cancelled = true;
}

bool cancellation_token::is_cancelled() const {
    return cancelled;
}

}  // namespace grader
