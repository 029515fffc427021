#include "WatchPipeline.hpp"
#include "StageRunner.hpp"
#include "../net/PageFetcher.hpp"
#include "../notify/ChangeNotifier.hpp"
#include "../processing/HtmlNormalizer.hpp"
#include "../processing/UnifiedDiff.hpp"
#include "../storage/IFingerprintStore.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Timestamp.hpp"

#include <plog/Log.h>

#include <chrono>
#include <optional>

namespace pipeline
{

using utils::ErrorCategory;
using utils::ErrorReporter;

WatchPipeline::WatchPipeline(const WatchConfig& config, net::IPageFetcher& fetcher,
                             storage::IFingerprintStore& store, notify::ChangeNotifier& notifier,
                             TimestampFn timestamp)
    : config_(config)
    , target_{ config.url, config.state_dir }
    , fetcher_(fetcher)
    , store_(store)
    , notifier_(notifier)
    , timestamp_(std::move(timestamp))
{
    if (!timestamp_)
        timestamp_ = [] { return utils::format_local_time(std::chrono::system_clock::now(), true); };
}

void WatchPipeline::enter(RunReport& report, PipelineState state) const
{
    report.trace.push_back(state);
    PLOG_VERBOSE << "[pipeline] " << target_.url << " -> " << to_string(state);
}

bool WatchPipeline::persist(RunReport& report, const std::string& text)
{
    enter(report, PipelineState::Persisting);

    std::string error;
    bool saved = false;
    try
    {
        saved = store_.save(target_, text, error);
    }
    catch (const std::exception& ex)
    {
        error = ex.what();
    }

    if (!saved)
    {
        report.persist_error = error.empty() ? std::string("unknown storage error") : error;
        ErrorReporter::ReportCritical(ErrorCategory::Persist,
                                      "Failed to save snapshot, the same change may be reported again next run",
                                      "url=" + target_.url + " stage=PERSISTING " + report.persist_error);
        return false;
    }
    report.persisted = true;
    return true;
}

RunReport WatchPipeline::run()
{
    RunReport report;

    enter(report, PipelineState::Fetching);
    net::FetchResult fetched;
    try
    {
        fetched = fetcher_.fetch(target_.url);
    }
    catch (const std::exception& ex)
    {
        fetched.ok = false;
        fetched.error = ex.what();
    }
    if (!fetched.ok)
    {
        enter(report, PipelineState::FetchFailed);
        report.outcome = RunOutcome::FetchFailed;
        report.fetch_error = fetched.error.empty() ? std::string("unknown fetch error") : fetched.error;
        ErrorReporter::ReportError(ErrorCategory::Fetch, "Failed to fetch " + target_.url,
                                   "stage=FETCHING " + report.fetch_error);
        return report;
    }

    enter(report, PipelineState::Normalizing);
    storage::Snapshot current = storage::Snapshot::fromText(processing::normalize_html(fetched.body));
    report.current_hash = current.sha256;
    PLOG_DEBUG << "Normalized " << fetched.body.size() << " bytes of markup to " << current.text.size()
               << " bytes of text (sha256 " << current.sha256 << ")";

    enter(report, PipelineState::Comparing);
    std::optional<storage::Snapshot> previous;
    std::string load_error;
    bool loaded = false;
    try
    {
        loaded = store_.load(target_, previous, load_error);
    }
    catch (const std::exception& ex)
    {
        load_error = ex.what();
    }
    if (!loaded)
    {
        enter(report, PipelineState::StateReadFailed);
        report.outcome = RunOutcome::StateUnreadable;
        report.persist_error = load_error.empty() ? std::string("unknown storage error") : load_error;
        ErrorReporter::ReportCritical(ErrorCategory::Persist, "Failed to read previous snapshot",
                                      "url=" + target_.url + " stage=COMPARING " + report.persist_error);
        return report;
    }

    if (!previous)
    {
        enter(report, PipelineState::Bootstrap);
        if (!persist(report, current.text))
        {
            enter(report, PipelineState::Done);
            report.outcome = RunOutcome::PersistFailed;
            return report;
        }
        enter(report, PipelineState::Done);
        report.outcome = RunOutcome::Bootstrapped;
        PLOG_INFO << "Initialized state for " << target_.url;
        return report;
    }

    report.previous_hash = previous->sha256;
    if (previous->sameContentAs(current))
    {
        enter(report, PipelineState::NoChange);
        enter(report, PipelineState::Done);
        report.outcome = RunOutcome::NoChange;
        PLOG_DEBUG << "No change on " << target_.url;
        return report;
    }

    enter(report, PipelineState::Changed);
    PLOG_INFO << "Change detected on " << target_.url << " (" << previous->sha256.substr(0, 12) << " -> "
              << current.sha256.substr(0, 12) << ")";

    enter(report, PipelineState::Notifying);
    auto diff_stage = run_stage<std::string>("diff",
                                             [&]()
                                             {
                                                 return processing::make_diff(previous->text, current.text,
                                                                              config_.max_diff_lines);
                                             });
    std::string diff_text = diff_stage.succeeded ? std::move(diff_stage.result)
                                                 : "(diff unavailable: " + diff_stage.error.value_or("unknown") + ")";
    report.diff = diff_text;

    report.notification_attempted = true;
    notify::NotifyResult sent = notifier_.notify(target_, previous->text, current.text, diff_text, timestamp_());
    report.notification_sent = sent.ok;
    if (!sent.ok)
    {
        report.notify_error = sent.error;
        ErrorReporter::ReportError(ErrorCategory::Notify, "Failed to send change notification",
                                   "url=" + target_.url + " stage=NOTIFYING " + sent.error);
    }

    // Saved whatever the notification outcome
    bool saved = persist(report, current.text);
    enter(report, PipelineState::Done);

    if (!saved)
        report.outcome = RunOutcome::PersistFailed;
    else
        report.outcome = sent.ok ? RunOutcome::ChangeNotified : RunOutcome::NotifyFailed;
    return report;
}

} // namespace pipeline
