#include "DownloadTypes.hpp"
#include "package/ZipPackage.hpp"

#include <exception>

namespace download
{

FetchOutcome::FetchOutcome()
    : status(FetchStatus::Failed)
{
}

FetchOutcome::~FetchOutcome() = default;
FetchOutcome::FetchOutcome(FetchOutcome&&) noexcept = default;
FetchOutcome& FetchOutcome::operator=(FetchOutcome&&) noexcept = default;

const char* toString(TransferErrorKind kind)
{
    switch (kind)
    {
    case TransferErrorKind::Connection:
        return "Connection";
    case TransferErrorKind::HttpStatus:
        return "HttpStatus";
    case TransferErrorKind::Read:
        return "Read";
    case TransferErrorKind::Write:
        return "Write";
    case TransferErrorKind::ShortTransfer:
        return "ShortTransfer";
    case TransferErrorKind::Package:
        return "Package";
    default:
        return "Unknown";
    }
}

std::string innermostMessage(const std::exception& e)
{
    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception& nested)
    {
        return innermostMessage(nested);
    }
    catch (...)
    {
        // Non-std cause has no message
        return e.what();
    }
    return e.what();
}

} // namespace download
