#include "organizer_types.h"
#include <QFileInfo>

QString FileEntry::fileName() const
{
    return QFileInfo(path).fileName();
}

MoveOperation MoveOperation::skipped(const QString& source, SkipReason reason, const QString& detail)
{
    MoveOperation op;
    op.source = source;
    op.outcome = Outcome::Skipped;
    op.reason = reason;
    op.detail = detail;
    return op;
}

QString organizationModeName(OrganizationMode mode)
{
    switch (mode) {
        case OrganizationMode::Category: return "Category";
        case OrganizationMode::Date: return "Date";
        case OrganizationMode::Hybrid: return "Hybrid";
    }
    return "";
}

QString renameModeName(RenameMode mode)
{
    switch (mode) {
        case RenameMode::Clean: return "Clean";
        case RenameMode::DatePrefix: return "Date prefix";
        case RenameMode::Skip: return "Skip";
    }
    return "";
}

QString skipReasonName(SkipReason reason)
{
    switch (reason) {
        case SkipReason::None: return "None";
        case SkipReason::PermissionDenied: return "Permission denied";
        case SkipReason::SourceNotFound: return "Source not found";
        case SkipReason::ProtectedPath: return "Protected path";
        case SkipReason::CrossDeviceCopyFailed: return "Cross-device copy failed";
        case SkipReason::DirectoryCreateFailed: return "Directory creation failed";
        case SkipReason::OtherIOError: return "I/O error";
    }
    return "";
}

QString describeSkip(const MoveOperation& op)
{
    if (op.detail.isEmpty()) return skipReasonName(op.reason);
    return QString("%1: %2").arg(skipReasonName(op.reason), op.detail);
}
