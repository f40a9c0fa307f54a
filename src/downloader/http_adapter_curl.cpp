/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - head() and get() on top of the libcurl easy API; one easy handle per request so
 *   concurrent fetchers never share state.
 * - Honors timeout, TLS verification, redirects and arbitrary request headers.
 * - get() delivers body bytes to the sink in blocks of at most 64 KiB, and only when
 *   the caller's status filter accepts the response status.
 * - HTTP statuses are returned, not mapped to errors; retry policy lives above.
 * - Cookies live in one CURLSH shared by every easy handle, loaded once from the
 *   Netscape-format load file and written to the save file by flushCookies().
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <ruget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <system_error>

namespace ruget::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where, std::string_view url) {
    Error err;
    err.message = std::string(where) + " " + std::string(url) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Header parser context
struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> contentDisposition;
    std::vector<Header> headers;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // A new status line starts a fresh header block (redirect hops)
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto name = trim(line.substr(0, colon));
    auto val = trim(line.substr(colon + 1));
    auto key = to_lower(name);

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    } else if (key == "content-disposition") {
        ctx->contentDisposition = val;
    }

    ctx->headers.push_back({std::move(name), std::move(val)});
    return total;
}

// Write sink context for get()
struct WriteContext {
    CURL* curl{nullptr};
    const StatusFilter* accept{nullptr};
    const BodySink* sink{nullptr};
    std::optional<bool> accepted{};
    std::optional<Error> sinkError{};
};

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->accepted) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->accepted = (*ctx->accept)(static_cast<int>(status));
    }
    if (!*ctx->accepted)
        return total; // discard body of a rejected status

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    // CURLOPT_BUFFERSIZE bounds each callback, split defensively anyway
    while (!bytes.empty()) {
        auto n = std::min(bytes.size(), kStreamBlockSize);
        auto r = (*ctx->sink)(bytes.first(n));
        if (!r) {
            ctx->sinkError = r.error();
            return 0; // signal error to curl => CURLE_WRITE_ERROR
        }
        bytes = bytes.subspan(n);
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const HttpSettings& settings) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(settings.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(settings.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(settings.maxRedirects));

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, settings.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, settings.insecure ? 0L : 2L);

    if (!settings.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, settings.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

// Cookie store shared by all easy handles of one adapter
class CookieShare {
public:
    CookieShare() : share_(curl_share_init()) {
        if (!share_)
            return;
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
    }
    ~CookieShare() {
        if (share_)
            curl_share_cleanup(share_);
    }
    CookieShare(const CookieShare&) = delete;
    CookieShare& operator=(const CookieShare&) = delete;

    CURLSH* handle() const { return share_; }

private:
    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<CookieShare*>(userptr)->locks_[static_cast<std::size_t>(data)].lock();
    }
    static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
        static_cast<CookieShare*>(userptr)->locks_[static_cast<std::size_t>(data)].unlock();
    }

    CURLSH* share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
};

static Result<void> rewriteWithoutSessionCookies(const std::filesystem::path& path) {
    std::string jar;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return Error{ErrorCode::IoError, "Cannot read cookie file " + path.string()};
        std::ostringstream ss;
        ss << in.rdbuf();
        jar = ss.str();
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::IoError, "Cannot write cookie file " + path.string()};
    out << filterSessionCookies(jar);
    out.flush();
    if (!out)
        return Error{ErrorCode::IoError, "Cannot write cookie file " + path.string()};
    return {};
}

std::string filterSessionCookies(std::string_view jar) {
    std::string out;
    out.reserve(jar.size());
    while (!jar.empty()) {
        auto nl = jar.find('\n');
        std::string_view line = jar.substr(0, nl);
        jar = nl == std::string_view::npos ? std::string_view{} : jar.substr(nl + 1);

        bool keep = true;
        const bool comment = line.starts_with('#') && !line.starts_with("#HttpOnly_");
        if (!comment && !trim(line).empty()) {
            // domain, subdomains, path, secure, expires, name, value
            std::string_view rest = line;
            for (int field = 0; field < 4 && !rest.empty(); ++field) {
                auto tab = rest.find('\t');
                rest = tab == std::string_view::npos ? std::string_view{} : rest.substr(tab + 1);
            }
            const auto expires = trim(rest.substr(0, rest.find('\t')));
            keep = !(expires.empty() || expires == "0");
        }
        if (keep) {
            out.append(line);
            if (nl != std::string_view::npos)
                out.push_back('\n');
        }
    }
    return out;
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(HttpSettings settings) : settings_(std::move(settings)) {
        if (settings_.loadCookies || settings_.saveCookies) {
            cookies_ = std::make_unique<CookieShare>();
            if (!cookies_->handle()) {
                spdlog::warn("curl_share_init failed; cookies disabled");
                cookies_.reset();
            }
        }
        if (cookies_ && settings_.loadCookies)
            loadCookies(*settings_.loadCookies);
    }
    ~CurlHttpAdapter() override = default;

    Result<void> flushCookies() override {
        if (!cookies_ || !settings_.saveCookies)
            return {};
        const auto& path = *settings_.saveCookies;
        if (path.has_parent_path()) {
            std::error_code ec;
            if (!std::filesystem::is_directory(path.parent_path(), ec)) {
                return Error{ErrorCode::IoError,
                             "Cannot save cookies: no directory " + path.parent_path().string()};
            }
        }

        CURL* curl = curl_easy_init();
        if (!curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        const std::string file = path.string();
        curl_easy_setopt(curl, CURLOPT_SHARE, cookies_->handle());
        curl_easy_setopt(curl, CURLOPT_COOKIEJAR, file.c_str());
        CURLcode rc = curl_easy_setopt(curl, CURLOPT_COOKIELIST, "FLUSH");
        curl_easy_cleanup(curl);
        if (rc != CURLE_OK)
            return makeCurlError(rc, "Saving cookies to", file);

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            spdlog::debug("No cookies to save to {}", file);
            return {};
        }
        if (!settings_.keepSessionCookies) {
            if (auto r = rewriteWithoutSessionCookies(path); !r)
                return r;
        }
        spdlog::debug("Saved cookies to {}", file);
        return {};
    }

    Result<ProbeResult> head(std::string_view url, const std::vector<Header>& headers) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        auto* list = build_header_list(headers);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        configure_common(curl, settings_);
        attachCookies(curl);

        CURLcode rc = curl_easy_perform(curl);
        long httpStatus = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            return makeCurlError(rc, "HEAD", url);
        }

        ProbeResult result;
        result.status = static_cast<int>(httpStatus);
        result.contentLength = hctx.contentLength;
        result.acceptsRanges = hctx.acceptRangesBytes;
        if (hctx.contentDisposition) {
            result.suggestedFilename = filenameFromContentDisposition(*hctx.contentDisposition);
        }
        spdlog::debug("HEAD {} -> {} (length={}, ranges={})", url, result.status,
                      result.contentLength ? std::to_string(*result.contentLength)
                                           : std::string("unknown"),
                      result.acceptsRanges);
        return result;
    }

    Result<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                             const StatusFilter& accept, const BodySink& sink) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        curl_slist* list = build_header_list(headers);

        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(kStreamBlockSize));

        WriteContext wctx;
        wctx.curl = curl;
        wctx.accept = &accept;
        wctx.sink = &sink;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        configure_common(curl, settings_);
        attachCookies(curl);

        CURLcode rc = curl_easy_perform(curl);

        long httpStatus = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET", url);
        }

        // Empty bodies never reach write_cb; still let the filter see the status
        if (!wctx.accepted)
            (void)accept(static_cast<int>(httpStatus));

        HttpResponse resp;
        resp.status = static_cast<int>(httpStatus);
        resp.headers = std::move(hctx.headers);
        return resp;
    }

private:
    void attachCookies(CURL* curl) const {
        if (!cookies_)
            return;
        curl_easy_setopt(curl, CURLOPT_SHARE, cookies_->handle());
        // "" turns the cookie engine on without reading a file
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    }

    void loadCookies(const std::filesystem::path& path) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            spdlog::warn("curl_easy_init failed; cookies from {} not loaded", path.string());
            return;
        }
        const std::string file = path.string();
        curl_easy_setopt(curl, CURLOPT_SHARE, cookies_->handle());
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, file.c_str());
        curl_easy_setopt(curl, CURLOPT_COOKIELIST, "RELOAD");
        curl_easy_cleanup(curl);
        spdlog::debug("Loaded cookies from {}", file);
    }

    HttpSettings settings_;
    std::unique_ptr<CookieShare> cookies_;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const HttpSettings& settings) {
    return std::make_unique<CurlHttpAdapter>(settings);
}

HttpGlobalScope::HttpGlobalScope() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::warn("curl_global_init failed; transfers will initialize lazily");
    }
}

HttpGlobalScope::~HttpGlobalScope() {
    curl_global_cleanup();
}

} // namespace ruget::downloader
