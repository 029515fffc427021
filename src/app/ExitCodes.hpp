#pragma once

#include "../pipeline/PipelineTypes.hpp"

namespace app
{

// Process exit status, one per run outcome so a scheduler can tell them apart
enum ExitCode : int
{
    kExitNoChange = 0,
    kExitFetchFailed = 1,
    kExitConfigError = 2,
    kExitBootstrapped = 3,
    kExitChangeNotified = 4,
    kExitNotifyFailed = 5,
    kExitPersistFailed = 6,
    kExitStateUnreadable = 7,
    kExitInternalError = 8,
};

inline int exit_code_for(pipeline::RunOutcome outcome)
{
    switch (outcome)
    {
    case pipeline::RunOutcome::NoChange:
        return kExitNoChange;
    case pipeline::RunOutcome::Bootstrapped:
        return kExitBootstrapped;
    case pipeline::RunOutcome::ChangeNotified:
        return kExitChangeNotified;
    case pipeline::RunOutcome::NotifyFailed:
        return kExitNotifyFailed;
    case pipeline::RunOutcome::FetchFailed:
        return kExitFetchFailed;
    case pipeline::RunOutcome::PersistFailed:
        return kExitPersistFailed;
    case pipeline::RunOutcome::StateUnreadable:
        return kExitStateUnreadable;
    }
    return kExitInternalError;
}

} // namespace app
