#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pipeline
{

// Pipeline state machine:
//   Fetching -> Normalizing -> Comparing -> {NoChange | Bootstrap | Changed}
//   Changed -> Notifying -> Persisting -> Done
//   Bootstrap -> Persisting -> Done, NoChange -> Done
// FetchFailed is terminal from Fetching, StateReadFailed is terminal from Comparing.
enum class PipelineState
{
    Fetching,
    Normalizing,
    Comparing,
    NoChange,
    Bootstrap,
    Changed,
    Notifying,
    Persisting,
    Done,
    FetchFailed,
    StateReadFailed
};

enum class RunOutcome
{
    NoChange,
    Bootstrapped,
    ChangeNotified,
    NotifyFailed,    // change detected and persisted, alert not delivered
    FetchFailed,     // nothing touched
    PersistFailed,   // bootstrap or change could not be saved
    StateUnreadable  // previous snapshot could not be read, nothing sent or written
};

struct RunReport
{
    RunOutcome outcome = RunOutcome::FetchFailed;
    std::vector<PipelineState> trace;

    std::string current_hash;
    std::string previous_hash;
    std::optional<std::string> diff;

    bool notification_attempted = false;
    bool notification_sent = false;
    bool persisted = false;

    std::string fetch_error;
    std::string notify_error;
    std::string persist_error;

    PipelineState finalState() const { return trace.empty() ? PipelineState::Fetching : trace.back(); }
};

const char* to_string(PipelineState state);
const char* to_string(RunOutcome outcome);

// True for outcomes where the stored snapshot now matches the fetched page
bool state_is_current(RunOutcome outcome);

} // namespace pipeline
