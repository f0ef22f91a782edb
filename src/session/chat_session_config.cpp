#include "rtchat/session/chat_session_config.hpp"

namespace rtchat {

std::shared_ptr<IBackoffPolicy> ChatSessionConfig::make_backoff_policy() const {
    if (backoff_policy) {
        return backoff_policy;
    }
    return std::make_shared<ExponentialBackoff>(
        backoff_base,
        backoff_multiplier,
        backoff_max,
        backoff_jitter
    );
}

ReconnectPolicy ChatSessionConfig::make_reconnect_policy() const {
    ReconnectPolicy policy;
    policy.with_max_attempts(max_attempts);
    return policy;
}

}  // namespace rtchat
