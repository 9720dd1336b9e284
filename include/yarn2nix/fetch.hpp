#pragma once

#include <yarn2nix/cancel.hpp>
#include <yarn2nix/result.hpp>
#include <string>

namespace yarn2nix {

struct FetchOptions {
    int timeout_seconds = 300;          // whole transfer
    int connect_timeout_seconds = 30;
    std::string user_agent = "yarn2nix";
};

// Only a complete 200 body is hashed. 204 and 206 would hash an empty or
// partial body, so they fail like any other status.
Status check_response_status(const std::string& url, long status);

// libcurl's process-wide state. Create one in main() before any thread
// starts fetching; it must outlive every UrlFetcher call.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_;
};

// Downloads a URL and hashes the body as it streams in. Safe to call from
// several threads at once (one curl handle per call).
class UrlFetcher {
public:
    explicit UrlFetcher(FetchOptions opts = {});

    // Hex SHA-1 of the response body. Any status but 200 and transport
    // errors are Network errors; a raised `cancel` aborts the transfer.
    Result<std::string> sha1_of(const std::string& url,
                                const CancelFlag* cancel = nullptr) const;

    const FetchOptions& options() const { return opts_; }

private:
    FetchOptions opts_;
};

} // namespace yarn2nix
