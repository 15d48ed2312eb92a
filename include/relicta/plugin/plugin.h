#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/types.h>

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace relicta::plugin {

class StreamReporter;
class StreamLogger;

/**
 * @brief Per-call context threaded from the host into the plugin implementation
 *
 * Cancellation is cooperative: the host can request a stop, the plugin decides
 * whether and when to honour it. On the plugin side the context also exposes
 * the per-connection progress reporter and stream logger.
 */
struct CallContext {
    std::stop_token stop;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// Host-minted progress token; plugins pass it to StreamReporter::start
    std::string progressToken;

    StreamReporter* progress{nullptr};
    StreamLogger* log{nullptr};

    [[nodiscard]] bool cancelled() const {
        if (stop.stop_requested()) {
            return true;
        }
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    static CallContext withTimeout(std::chrono::milliseconds timeout) {
        CallContext ctx;
        ctx.deadline = std::chrono::steady_clock::now() + timeout;
        return ctx;
    }
};

/**
 * @brief Contract implemented by every plugin
 *
 * Business failures are reported inside the responses (success=false,
 * ValidateResponse::errors). The error side of the Result is reserved for
 * failures to produce a response at all.
 */
class IPlugin {
public:
    virtual ~IPlugin() = default;

    virtual Info getInfo() = 0;

    virtual Result<ExecuteResponse> execute(const CallContext& ctx,
                                            const ExecuteRequest& request) = 0;

    virtual Result<ValidateResponse> validate(const CallContext& ctx, const ConfigMap& config) = 0;
};

} // namespace relicta::plugin
