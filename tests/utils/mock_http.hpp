#pragma once

#include "download/HttpStream.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace test_utils {

// Scripted HTTP response served by MockHttpTransport
struct MockResponse {
    int status_code = 200;
    std::string body;
    // Defaults to body.size(); std::nullopt simulates a missing Content-Length header
    std::optional<std::uint64_t> content_length;
    bool use_body_length = true;

    // Upper bound for each successive read call; reads past the list are unbounded
    std::vector<std::size_t> read_sizes;

    // Throw std::runtime_error(error_message) on the read with this index
    std::optional<std::size_t> fail_on_read;
    // Block the read with this index until the token is cancelled
    std::optional<std::size_t> block_on_read;

    // Fail open() itself with error_message
    bool has_error = false;
    std::string error_message;
};

// In-memory HttpTransport for tests
class MockHttpTransport : public download::HttpTransport {
public:
    std::unique_ptr<download::ResponseStream> open(const std::string& url,
                                                   const download::RequestOptions& options,
                                                   const download::CancellationToken& token) override;

    // Set response for a specific URL
    void setResponse(const std::string& url, const MockResponse& response);

    // Simulate a network error for all requests
    void simulateNetworkError(const std::string& error_msg);

    void clearResponses();

    int openCount() const { return open_count_; }
    const download::RequestOptions& lastRequest() const { return last_request_; }
    const std::string& lastUrl() const { return last_url_; }

private:
    std::unordered_map<std::string, MockResponse> url_responses_;
    bool simulate_error_ = false;
    std::string error_message_;

    std::atomic<int> open_count_{0};
    download::RequestOptions last_request_;
    std::string last_url_;
};

// Common responses
class MockResponses {
public:
    static MockResponse ok(const std::string& body);
    static MockResponse without_length(const std::string& body);
    static MockResponse not_found();
    static MockResponse reset_after(const std::string& body, std::size_t reads, const std::string& message);
};

}  // namespace test_utils
