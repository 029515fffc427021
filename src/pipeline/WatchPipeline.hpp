#pragma once

#include "PipelineTypes.hpp"
#include "../config/WatchConfig.hpp"
#include "../storage/Snapshot.hpp"

#include <functional>
#include <string>

namespace net
{
class IPageFetcher;
}

namespace storage
{
class IFingerprintStore;
}

namespace notify
{
class ChangeNotifier;
}

namespace pipeline
{

// One invocation of the change-detection pipeline for the configured target.
//
// The snapshot is written on bootstrap and on every detected change, whatever
// the notification outcome, so a change is never reported twice because an
// alert failed. A failed fetch or an unreadable snapshot leaves state untouched.
class WatchPipeline
{
public:
    using TimestampFn = std::function<std::string()>;

    WatchPipeline(const WatchConfig& config, net::IPageFetcher& fetcher, storage::IFingerprintStore& store,
                  notify::ChangeNotifier& notifier, TimestampFn timestamp = {});

    RunReport run();

    const storage::WatchTarget& target() const { return target_; }

private:
    void enter(RunReport& report, PipelineState state) const;
    bool persist(RunReport& report, const std::string& text);

    const WatchConfig& config_;
    storage::WatchTarget target_;
    net::IPageFetcher& fetcher_;
    storage::IFingerprintStore& store_;
    notify::ChangeNotifier& notifier_;
    TimestampFn timestamp_;
};

} // namespace pipeline
