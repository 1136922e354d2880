#include "application/RetryPolicy.hpp"
#include <algorithm>
#include <iostream>

namespace psyche::application {

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    long long delay = baseDelay.count();
    for (int i = 0; i < attempt && delay < maxDelay.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, static_cast<long long>(maxDelay.count())));
}

bool RetryPolicy::run(const std::function<bool(int)>& attempt, const CancellationToken& token, const std::string& tag) const {
    for (int i = 0; i <= maxRetries; ++i) {
        if (token.isCancelled()) return false;
        if (attempt(i)) return true;
        if (i == maxRetries) break;

        auto delay = delayFor(i);
        std::cerr << tag << " Attempt " << (i + 1) << " failed, retrying in " << delay.count() << "ms" << std::endl;
        if (token.waitFor(delay)) return false;
    }
    return false;
}

} // namespace psyche::application
