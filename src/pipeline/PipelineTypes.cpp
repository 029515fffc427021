#include "PipelineTypes.hpp"

namespace pipeline
{

const char* to_string(PipelineState state)
{
    switch (state)
    {
    case PipelineState::Fetching:
        return "FETCHING";
    case PipelineState::Normalizing:
        return "NORMALIZING";
    case PipelineState::Comparing:
        return "COMPARING";
    case PipelineState::NoChange:
        return "NO_CHANGE";
    case PipelineState::Bootstrap:
        return "BOOTSTRAP";
    case PipelineState::Changed:
        return "CHANGED";
    case PipelineState::Notifying:
        return "NOTIFYING";
    case PipelineState::Persisting:
        return "PERSISTING";
    case PipelineState::Done:
        return "DONE";
    case PipelineState::FetchFailed:
        return "FETCH_FAILED";
    case PipelineState::StateReadFailed:
        return "STATE_READ_FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(RunOutcome outcome)
{
    switch (outcome)
    {
    case RunOutcome::NoChange:
        return "no-change";
    case RunOutcome::Bootstrapped:
        return "bootstrapped";
    case RunOutcome::ChangeNotified:
        return "change-notified";
    case RunOutcome::NotifyFailed:
        return "change-detected-notify-failed";
    case RunOutcome::FetchFailed:
        return "fetch-failed";
    case RunOutcome::PersistFailed:
        return "persist-failed";
    case RunOutcome::StateUnreadable:
        return "state-unreadable";
    }
    return "unknown";
}

bool state_is_current(RunOutcome outcome)
{
    switch (outcome)
    {
    case RunOutcome::NoChange:
    case RunOutcome::Bootstrapped:
    case RunOutcome::ChangeNotified:
    case RunOutcome::NotifyFailed:
        return true;
    default:
        return false;
    }
}

} // namespace pipeline
