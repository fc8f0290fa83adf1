#pragma once

#include "HttpStream.hpp"

namespace download
{

// HttpTransport backed by cpr. Each stream runs its libcurl transfer on a worker thread
// and hands the body to the reader through a bounded buffer.
class CprTransport : public HttpTransport
{
public:
    std::unique_ptr<ResponseStream> open(const std::string& url, const RequestOptions& options,
                                         const CancellationToken& token) override;
};

} // namespace download
