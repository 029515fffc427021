#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include <vector>

#include "notify/ChangeNotifier.hpp"
#include "pipeline/WatchPipeline.hpp"
#include "storage/FileFingerprintStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/mock_http.hpp"
#include "utils/temp_dir.hpp"

using pipeline::PipelineState;
using pipeline::RunOutcome;
using pipeline::WatchPipeline;
using storage::FileFingerprintStore;
using test_utils::MockPageFetcher;
using test_utils::RecordingMailTransport;
using test_utils::TempDir;

namespace
{

constexpr const char* kUrl = "https://example.com/watched";

// File store whose reads or writes can be switched off
class FlakyStore : public storage::IFingerprintStore
{
public:
    bool fail_load = false;
    bool fail_save = false;
    int saves = 0;

    bool load(const storage::WatchTarget& target, std::optional<storage::Snapshot>& out,
              std::string& outError) override
    {
        if (fail_load)
        {
            outError = "permission denied";
            return false;
        }
        return inner_.load(target, out, outError);
    }

    bool save(const storage::WatchTarget& target, const std::string& text, std::string& outError) override
    {
        ++saves;
        if (fail_save)
        {
            outError = "disk full";
            return false;
        }
        return inner_.save(target, text, outError);
    }

private:
    FileFingerprintStore inner_;
};

struct Fixture
{
    TempDir tmp;
    WatchConfig config;
    MockPageFetcher fetcher;
    FlakyStore store;
    RecordingMailTransport transport;
    notify::ChangeNotifier notifier;
    WatchPipeline watcher;

    Fixture()
        : config(make_config(tmp))
        , notifier(notify::NotifierSettings{ "watch@example.com", { "ops@example.com" }, "[Page Watch]" }, transport)
        , watcher(config, fetcher, store, notifier, [] { return std::string("2024-05-01 12:00:00 UTC"); })
    {
        utils::ErrorReporter::ClearErrors();
    }

    static WatchConfig make_config(const TempDir& dir)
    {
        WatchConfig cfg;
        cfg.url = kUrl;
        cfg.api_key = "re_test";
        cfg.sender = "watch@example.com";
        cfg.recipients = { "ops@example.com" };
        cfg.state_dir = (dir.path() / "state").string();
        return cfg;
    }

    std::string storedText() const { return test_utils::read_file(FileFingerprintStore::textPath(watcher.target())); }
    bool hasState() const { return std::filesystem::exists(FileFingerprintStore::textPath(watcher.target())); }
};

} // namespace

TEST_CASE("First run bootstraps without notifying", "[pipeline]")
{
    Fixture f;
    f.fetcher.setPage(kUrl, "<html><body>Hello</body></html>");

    auto report = f.watcher.run();

    REQUIRE(report.outcome == RunOutcome::Bootstrapped);
    REQUIRE(report.trace == std::vector<PipelineState>{ PipelineState::Fetching, PipelineState::Normalizing,
                                                        PipelineState::Comparing, PipelineState::Bootstrap,
                                                        PipelineState::Persisting, PipelineState::Done });
    REQUIRE(f.transport.sendCount() == 0);
    REQUIRE_FALSE(report.notification_attempted);
    REQUIRE(report.persisted);
    REQUIRE(f.storedText() == "Hello");
    REQUIRE(test_utils::read_file(FileFingerprintStore::hashPath(f.watcher.target())) == report.current_hash);
}

TEST_CASE("Unchanged page sends nothing", "[pipeline]")
{
    Fixture f;
    f.fetcher.setPage(kUrl, "<html><body>Hello</body></html>");
    REQUIRE(f.watcher.run().outcome == RunOutcome::Bootstrapped);

    SECTION("identical markup")
    {
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::NoChange);
        REQUIRE(f.fetcher.callCount() == 2);
        REQUIRE(report.finalState() == PipelineState::Done);
        REQUIRE(report.trace.size() == 5);
        REQUIRE(report.trace[3] == PipelineState::NoChange);
        REQUIRE(report.previous_hash == report.current_hash);
    }

    SECTION("markup noise that normalizes away")
    {
        f.fetcher.setPage(kUrl, "<!DOCTYPE html>\n<html>\n  <head><script>var t = 99;</script></head>\n"
                                "  <body>\n    Hello\n  </body>\n</html>\n");
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::NoChange);
    }

    REQUIRE(f.transport.sendCount() == 0);
    REQUIRE(f.storedText() == "Hello");
}

TEST_CASE("Changed page notifies once and advances the snapshot", "[pipeline]")
{
    Fixture f;
    f.fetcher.setPage(kUrl, "<html><body>Hello</body></html>");
    REQUIRE(f.watcher.run().outcome == RunOutcome::Bootstrapped);

    f.fetcher.setPage(kUrl, "<html><body><p>Hello</p><p>World</p></body></html>");
    auto report = f.watcher.run();

    REQUIRE(report.outcome == RunOutcome::ChangeNotified);
    REQUIRE(report.trace == std::vector<PipelineState>{ PipelineState::Fetching, PipelineState::Normalizing,
                                                        PipelineState::Comparing, PipelineState::Changed,
                                                        PipelineState::Notifying, PipelineState::Persisting,
                                                        PipelineState::Done });
    REQUIRE(f.transport.sendCount() == 1);
    REQUIRE(report.diff.has_value());
    REQUIRE(report.diff->find("+World") != std::string::npos);
    REQUIRE(f.storedText() == "Hello\nWorld");

    const auto& msg = f.transport.sent().front();
    REQUIRE(msg.subject == "[Page Watch] Change detected @ 2024-05-01 12:00:00 UTC");
    REQUIRE(msg.text->find("+World") != std::string::npos);

    SECTION("the same change is not reported again")
    {
        REQUIRE(f.watcher.run().outcome == RunOutcome::NoChange);
        REQUIRE(f.transport.sendCount() == 1);
    }
}

TEST_CASE("Notification failure still persists", "[pipeline][errors]")
{
    Fixture f;
    f.fetcher.setPage(kUrl, "<p>v1</p>");
    REQUIRE(f.watcher.run().outcome == RunOutcome::Bootstrapped);

    f.transport.failWith("Resend error 401: API key is invalid");
    f.fetcher.setPage(kUrl, "<p>v2</p>");
    auto report = f.watcher.run();

    REQUIRE(report.outcome == RunOutcome::NotifyFailed);
    REQUIRE(report.notification_attempted);
    REQUIRE_FALSE(report.notification_sent);
    REQUIRE(report.notify_error.find("API key is invalid") != std::string::npos);
    REQUIRE(report.persisted);
    REQUIRE(f.storedText() == "v2");
    REQUIRE(pipeline::state_is_current(report.outcome));

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].category == utils::ErrorCategory::Notify);

    // No retry on the next run
    f.transport.succeed();
    REQUIRE(f.watcher.run().outcome == RunOutcome::NoChange);
    REQUIRE(f.transport.sendCount() == 1);
}

TEST_CASE("Fetch failure leaves state untouched", "[pipeline][errors]")
{
    Fixture f;

    SECTION("before any state exists")
    {
        f.fetcher.simulateNetworkError("Connection timed out");
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::FetchFailed);
        REQUIRE(report.trace == std::vector<PipelineState>{ PipelineState::Fetching, PipelineState::FetchFailed });
        REQUIRE(report.fetch_error == "Connection timed out");
        REQUIRE_FALSE(f.hasState());
        REQUIRE(f.store.saves == 0);
        REQUIRE(f.fetcher.callCount() == 1);
    }

    SECTION("with existing state")
    {
        f.fetcher.setPage(kUrl, "<p>stable</p>");
        REQUIRE(f.watcher.run().outcome == RunOutcome::Bootstrapped);
        const std::string before = f.storedText();

        test_utils::MockResponse unavailable;
        unavailable.status_code = 503;
        unavailable.body = "<p>maintenance</p>";
        f.fetcher.setResponse(kUrl, unavailable);

        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::FetchFailed);
        REQUIRE(report.fetch_error == "HTTP 503");
        REQUIRE(f.storedText() == before);
        REQUIRE(f.store.saves == 1);
    }

    REQUIRE(f.transport.sendCount() == 0);
    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].category == utils::ErrorCategory::Fetch);
}

TEST_CASE("Storage failures", "[pipeline][errors]")
{
    Fixture f;

    SECTION("bootstrap that cannot be saved")
    {
        f.store.fail_save = true;
        f.fetcher.setPage(kUrl, "<p>Hello</p>");
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::PersistFailed);
        REQUIRE(report.persist_error == "disk full");
        REQUIRE_FALSE(report.persisted);
        REQUIRE(f.transport.sendCount() == 0);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Persist);
        REQUIRE(errors[0].severity == utils::ErrorSeverity::Critical);
    }

    SECTION("change that is notified but cannot be saved")
    {
        f.fetcher.setPage(kUrl, "<p>v1</p>");
        REQUIRE(f.watcher.run().outcome == RunOutcome::Bootstrapped);

        f.store.fail_save = true;
        f.fetcher.setPage(kUrl, "<p>v2</p>");
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::PersistFailed);
        REQUIRE(report.notification_sent);
        REQUIRE(f.transport.sendCount() == 1);
        REQUIRE(f.storedText() == "v1");
        REQUIRE_FALSE(pipeline::state_is_current(report.outcome));

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].severity == utils::ErrorSeverity::Critical);
        REQUIRE(std::string(utils::ErrorReporter::SeverityToString(errors[0].severity)) == "Critical");
    }

    SECTION("unreadable snapshot stops before notifying or writing")
    {
        f.store.fail_load = true;
        f.fetcher.setPage(kUrl, "<p>Hello</p>");
        auto report = f.watcher.run();
        REQUIRE(report.outcome == RunOutcome::StateUnreadable);
        REQUIRE(report.finalState() == PipelineState::StateReadFailed);
        REQUIRE(f.store.saves == 0);
        REQUIRE(f.transport.sendCount() == 0);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Persist);
        REQUIRE(errors[0].severity == utils::ErrorSeverity::Critical);
    }
}

TEST_CASE("Failure severities are ordered", "[pipeline][errors]")
{
    Fixture f;
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());

    f.fetcher.simulateNetworkError("Connection refused");
    REQUIRE(f.watcher.run().outcome == RunOutcome::FetchFailed);
    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.back().severity == utils::ErrorSeverity::Error);
    REQUIRE(errors.back().severity < utils::ErrorSeverity::Critical);

    utils::ErrorReporter::ClearErrors();
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("Pipeline names", "[pipeline]")
{
    REQUIRE(std::string(pipeline::to_string(PipelineState::Notifying)) == "NOTIFYING");
    REQUIRE(std::string(pipeline::to_string(PipelineState::FetchFailed)) == "FETCH_FAILED");
    REQUIRE(std::string(pipeline::to_string(RunOutcome::NotifyFailed)) == "change-detected-notify-failed");
}
