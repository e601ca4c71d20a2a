#include "PC_CopyTypes.h"

const char* PC_WorkerStatusToString(PC_WorkerStatus status)
{
    switch (status)
    {
    case PC_WorkerStatus::Success:   return "Success";
    case PC_WorkerStatus::Failed:    return "Failed";
    case PC_WorkerStatus::Cancelled: return "Cancelled";
    default:                         return "Unknown";
    }
}

const char* PC_CopyResultKindToString(PC_CopyResultKind kind)
{
    switch (kind)
    {
    case PC_CopyResultKind::Completed:           return "Completed";
    case PC_CopyResultKind::CompletedWithErrors: return "CompletedWithErrors";
    case PC_CopyResultKind::Cancelled:           return "Cancelled";
    default:                                     return "Unknown";
    }
}
