#include <yarn2nix/fetch.hpp>
#include <yarn2nix/sha1.hpp>
#include <yarn2nix/log.hpp>

#include <curl/curl.h>

namespace yarn2nix {

CurlGlobal::CurlGlobal()
    : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

namespace {

struct Transfer {
    SHA1 hasher;
    size_t bytes = 0;
    const CancelFlag* cancel = nullptr;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    if (is_cancelled(t->cancel)) return 0;  // aborts with CURLE_WRITE_ERROR
    size_t n = size * nmemb;
    t->hasher.update(reinterpret_cast<const uint8_t*>(ptr), n);
    t->bytes += n;
    return n;
}

int on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return is_cancelled(t->cancel) ? 1 : 0;
}

// RAII for the easy handle
struct EasyHandle {
    CURL* curl;
    EasyHandle() : curl(curl_easy_init()) {}
    ~EasyHandle() { if (curl) curl_easy_cleanup(curl); }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

} // anonymous namespace

UrlFetcher::UrlFetcher(FetchOptions opts)
    : opts_(std::move(opts)) {}

Status check_response_status(const std::string& url, long status) {
    // Non-HTTP schemes (file://) report 0
    if (status == 200 || status == 0) return ok_status();
    return Yarn2nixError{Yarn2nixError::Network,
        "request failed: " + url + ": status " + std::to_string(status)};
}

Result<std::string> UrlFetcher::sha1_of(const std::string& url,
                                        const CancelFlag* cancel) const {
    EasyHandle handle;
    if (!handle.curl) {
        return Yarn2nixError{Yarn2nixError::Network, "curl init failed"};
    }
    CURL* curl = handle.curl;

    Transfer transfer;
    transfer.cancel = cancel;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opts_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(opts_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    log::debug("fetching %s", url.c_str());
    CURLcode res = curl_easy_perform(curl);

    if (is_cancelled(cancel)) {
        return Yarn2nixError{Yarn2nixError::Cancelled, "fetch cancelled: " + url};
    }
    if (res != CURLE_OK) {
        return Yarn2nixError{Yarn2nixError::Network,
            "request failed: " + url + ": " + curl_easy_strerror(res)};
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    YARN2NIX_TRY(check_response_status(url, status));

    log::debug("fetched %s (%zu bytes)", url.c_str(), transfer.bytes);
    return Result<std::string>::ok(SHA1::bytes_to_hex(transfer.hasher.finalize()));
}

} // namespace yarn2nix
