#include "engine/http_engine_client.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <memory>

using json = nlohmann::json;

namespace dockbox::engine {

namespace {

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    const size_t total = size * nmemb;
    out->append(ptr, total);
    return total;
}

// Collects "Name: value" header lines, keyed by lowercase name
size_t collect_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const size_t total = size * nmemb;
    std::string line(ptr, total);

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        size_t end = value.find_last_not_of(" \t\r\n");
        value = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);
        (*headers)[name] = value;
    }
    return total;
}

// Aborts the transfer once the call context is cancelled or expired
int abort_on_context(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<const util::CallContext*>(clientp);
    return ctx->done() ? 1 : 0;
}

std::string transfer_error(CURLcode code, const util::CallContext& ctx) {
    if ((code == CURLE_ABORTED_BY_CALLBACK || code == CURLE_OPERATION_TIMEDOUT) && ctx.done()) {
        return util::context_error_to_string(ctx.error());
    }
    // The timer comes from the deadline and can fire a moment before it
    if (code == CURLE_OPERATION_TIMEDOUT && ctx.deadline()) {
        return util::context_error_to_string(util::ContextError::DEADLINE_EXCEEDED);
    }
    return curl_easy_strerror(code);
}

// Percent-encodes one path segment. Unreserved characters, ':' and '@'
// stay literal; "." and ".." are encoded so nothing collapses them.
std::string escape_path_segment(const std::string& segment) {
    static const char hex[] = "0123456789ABCDEF";
    const bool dot_segment = segment == "." || segment == "..";

    std::string out;
    for (unsigned char c : segment) {
        bool literal = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                       c == '~' || c == ':' || c == '@' || (c == '.' && !dot_segment);
        if (literal) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// Image names keep their '/' separators; every segment is escaped
std::string escape_image_path(const std::string& image) {
    std::string out;
    size_t start = 0;
    while (true) {
        size_t slash = image.find('/', start);
        out += escape_path_segment(image.substr(start, slash - start));
        if (slash == std::string::npos) {
            return out;
        }
        out += '/';
        start = slash + 1;
    }
}

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

// Streamed pull body driven through a private multi handle
class CurlPullStream : public PullStream {
public:
    CurlPullStream(CURL* easy, util::CallContext ctx)
        : easy_(easy)
        , ctx_(std::move(ctx))
        , multi_(curl_multi_init()) {
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlPullStream::on_write);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlPullStream::on_header);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, abort_on_context);
        curl_easy_setopt(easy_, CURLOPT_XFERINFODATA, &ctx_);
        curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);

        if (multi_) {
            curl_multi_add_handle(multi_, easy_);
        }
    }

    ~CurlPullStream() override {
        close();
    }

    CurlPullStream(const CurlPullStream&) = delete;
    CurlPullStream& operator=(const CurlPullStream&) = delete;

    // Drive the transfer until the response headers are in
    bool start(std::string& error) {
        if (!multi_) {
            error = "failed to initialise HTTP transfer";
            return false;
        }

        while (!headers_done_ && !finished_) {
            if (ctx_.done()) {
                error = util::context_error_to_string(ctx_.error());
                return false;
            }
            if (!pump(error)) {
                return false;
            }
        }

        if (!headers_done_ && result_ != CURLE_OK) {
            error = transfer_error(result_, ctx_);
            return false;
        }

        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &http_status_);
        return true;
    }

    long http_status() const { return http_status_; }

    StreamStatus read(std::string& chunk, std::string& error) override {
        if (closed_) {
            error = "read on closed stream";
            return StreamStatus::FAILED;
        }

        while (pending_.empty()) {
            if (finished_) {
                if (result_ == CURLE_OK) {
                    return StreamStatus::END;
                }
                error = transfer_error(result_, ctx_);
                return StreamStatus::FAILED;
            }
            if (ctx_.done()) {
                error = util::context_error_to_string(ctx_.error());
                return StreamStatus::FAILED;
            }
            if (!pump(error)) {
                return StreamStatus::FAILED;
            }
        }

        chunk.append(pending_);
        pending_.clear();
        return StreamStatus::DATA;
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;

        if (multi_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
    }

private:
    CURL* easy_;
    util::CallContext ctx_;
    CURLM* multi_;

    std::string pending_;
    long http_status_ = 0;
    bool headers_done_ = false;
    bool finished_ = false;
    bool closed_ = false;
    CURLcode result_ = CURLE_OK;

    // One step of the transfer; waits briefly for socket activity if idle
    bool pump(std::string& error) {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            error = curl_multi_strerror(mc);
            return false;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }

        if (!finished_ && pending_.empty()) {
            mc = curl_multi_poll(multi_, nullptr, 0, 100, nullptr);
            if (mc != CURLM_OK) {
                error = curl_multi_strerror(mc);
                return false;
            }
        }
        return true;
    }

    static size_t on_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlPullStream*>(userdata);
        const size_t total = size * nmemb;
        self->pending_.append(ptr, total);
        return total;
    }

    static size_t on_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlPullStream*>(userdata);
        const size_t total = size * nmemb;
        // Blank line ends a header block; interim 1xx blocks are followed by another
        if (total == 2 && ptr[0] == '\r' && ptr[1] == '\n') {
            long status = 0;
            curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 200) {
                self->headers_done_ = true;
            }
        }
        return total;
    }
};

} // namespace

// ============================================================================
// Shared transport setup
// ============================================================================

void apply_transport_options(CURL* curl, const EngineEndpoint& endpoint) {
    if (endpoint.scheme == EndpointScheme::UNIX) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, endpoint.socket_path.c_str());
    }

    if (endpoint.tls) {
        const auto& tls = *endpoint.tls;
        if (!tls.ca_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, tls.ca_file.c_str());
        }
        if (!tls.cert_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_SSLCERT, tls.cert_file.c_str());
        }
        if (!tls.key_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_SSLKEY, tls.key_file.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, tls.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, tls.verify_peer ? 2L : 0L);
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Paths are sent exactly as built
    curl_easy_setopt(curl, CURLOPT_PATH_AS_IS, 1L);
}

void apply_context_timeout(CURL* curl, const util::CallContext& ctx) {
    auto remaining = ctx.remaining();
    if (remaining) {
        // 0 means "no timeout" to curl, so an expired budget still gets 1ms
        long ms = std::max<long>(1, static_cast<long>(remaining->count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, ms);
    }
}

std::string daemon_error_message(long http_status, const std::string& body) {
    std::string message;
    try {
        json j = json::parse(body);
        if (j.is_object()) {
            message = j.value("message", "");
        }
    } catch (const json::exception&) {
        // Not JSON; fall back to the raw body
    }

    if (message.empty()) {
        message = body;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
    }
    if (message.empty()) {
        message = "HTTP status " + std::to_string(http_status);
    }
    return "Error response from daemon: " + message;
}

// ============================================================================
// HttpEngineClient Implementation
// ============================================================================

HttpEngineClient::HttpEngineClient(const EngineEndpoint& endpoint, CURL* curl)
    : endpoint_(endpoint)
    , api_version_(endpoint.api_version)
    , curl_(curl) {
    spdlog::trace("Engine client created for {}", endpoint_.host);
}

HttpEngineClient::~HttpEngineClient() {
    close();
}

void HttpEngineClient::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    spdlog::trace("Engine client for {} closed", endpoint_.host);
}

std::string HttpEngineClient::url_for(const std::string& path, bool versioned) const {
    if (!versioned) {
        return endpoint_.base_url() + path;
    }
    return endpoint_.base_url() + "/v" + api_version_ + path;
}

std::string HttpEngineClient::escape(const std::string& value) const {
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size())), curl_free);
    if (!escaped) {
        return value;
    }
    return std::string(escaped.get());
}

EngineResponse HttpEngineClient::perform(const std::string& method,
                                         const std::string& path,
                                         const std::string* json_body,
                                         const util::CallContext& ctx,
                                         bool versioned,
                                         std::map<std::string, std::string>* headers_out) {
    EngineResponse response;

    if (closed_ || !curl_) {
        response.error = "engine client is closed";
        return response;
    }
    if (ctx.done()) {
        response.error = util::context_error_to_string(ctx.error());
        return response;
    }

    // Reset keeps the connection cache, so keep-alive survives between calls
    curl_easy_reset(curl_);
    apply_transport_options(curl_, endpoint_);
    apply_context_timeout(curl_, ctx);

    const std::string url = url_for(path, versioned);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

    std::map<std::string, std::string> headers;
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &headers);

    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_on_context);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);

    struct curl_slist* request_headers = nullptr;
    if (json_body) {
        request_headers = curl_slist_append(request_headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, request_headers);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
    } else if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, 0L);
    }

    spdlog::trace("{} {}", method, url);
    const CURLcode res = curl_easy_perform(curl_);

    if (request_headers) {
        curl_slist_free_all(request_headers);
    }

    if (res != CURLE_OK) {
        response.error = transfer_error(res, ctx);
        return response;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.http_status);
    response.success = is_success_status(response.http_status);
    if (!response.success) {
        response.error = daemon_error_message(response.http_status, response.body);
    }

    if (headers_out) {
        *headers_out = std::move(headers);
    }
    return response;
}

EngineResponse HttpEngineClient::ping(const util::CallContext& ctx) {
    std::map<std::string, std::string> headers;
    EngineResponse response = perform("GET", "/_ping", nullptr, ctx, false, &headers);
    if (!response.success) {
        return response;
    }

    if (endpoint_.negotiate_version) {
        auto it = headers.find("api-version");
        std::string server_version = (it != headers.end() && !it->second.empty())
            ? it->second : FALLBACK_API_VERSION;

        // Only ever downgrade to what an older daemon understands
        if (compare_api_versions(server_version, api_version_) < 0) {
            spdlog::debug("Negotiated API version {} with {} (client default {})",
                server_version, endpoint_.host, api_version_);
            api_version_ = server_version;
        }
    }
    return response;
}

EngineResponse HttpEngineClient::inspect_image(const std::string& image,
                                               const util::CallContext& ctx) {
    return perform("GET", "/images/" + escape_image_path(image) + "/json", nullptr, ctx);
}

PullResponse HttpEngineClient::pull_image(const std::string& image,
                                          const util::CallContext& ctx) {
    PullResponse response;

    if (closed_ || !curl_) {
        response.error = "engine client is closed";
        return response;
    }

    CURL* easy = curl_easy_init();
    if (!easy) {
        response.error = "failed to initialise HTTP transfer";
        return response;
    }

    ImageReference ref = split_image_reference(image);
    const std::string url = url_for("/images/create?fromImage=" + escape(ref.repository) +
                                    "&tag=" + escape(ref.tag));

    // No curl timer here: the stream ends the transfer from `ctx`, so an
    // expired budget always reads as the context's deadline
    apply_transport_options(easy, endpoint_);
    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_POST, 1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS, "");
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, 0L);

    spdlog::trace("POST {}", url);
    auto stream = std::make_unique<CurlPullStream>(easy, ctx);

    std::string error;
    if (!stream->start(error)) {
        response.error = error;
        return response;
    }

    if (!is_success_status(stream->http_status())) {
        // Error bodies are short JSON documents; read them for the message
        DrainResult body = drain_stream(*stream);
        response.error = daemon_error_message(stream->http_status(), body.text);
        return response;
    }

    response.success = true;
    response.stream = std::move(stream);
    return response;
}

CreateResponse HttpEngineClient::create_container(const ContainerSpec& spec,
                                                  const HostConfig&,
                                                  const std::string& name,
                                                  const util::CallContext& ctx) {
    CreateResponse response;

    json body;
    body["Image"] = spec.image;
    body["WorkingDir"] = spec.working_dir;
    body["Tty"] = spec.tty;
    body["OpenStdin"] = spec.open_stdin;
    body["StdinOnce"] = spec.stdin_once;
    body["HostConfig"] = json::object();
    const std::string payload = body.dump();

    std::string path = "/containers/create";
    if (!name.empty()) {
        path += "?name=" + escape(name);
    }

    EngineResponse result = perform("POST", path, &payload, ctx);
    if (!result.success) {
        response.error = result.error;
        return response;
    }

    try {
        json j = json::parse(result.body);
        response.id = j.value("Id", "");
        if (j.contains("Warnings") && j["Warnings"].is_array()) {
            for (const auto& w : j["Warnings"]) {
                if (w.is_string()) {
                    response.warnings.push_back(w.get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        response.error = std::string("invalid create response: ") + e.what();
        return response;
    }

    if (response.id.empty()) {
        response.error = "engine returned no container id";
        return response;
    }

    response.success = true;
    return response;
}

EngineResponse HttpEngineClient::start_container(const std::string& id,
                                                 const util::CallContext& ctx) {
    EngineResponse response = perform("POST", "/containers/" + escape(id) + "/start", nullptr, ctx);
    // 304: already started
    if (!response.success && response.http_status == 304) {
        response.success = true;
        response.error.clear();
    }
    return response;
}

EngineResponse HttpEngineClient::remove_container(const std::string& id, bool force,
                                                  const util::CallContext& ctx) {
    std::string path = "/containers/" + escape(id);
    if (force) {
        path += "?force=true";
    }
    return perform("DELETE", path, nullptr, ctx);
}

// ============================================================================
// HttpEngineConnector Implementation
// ============================================================================

ConnectResult HttpEngineConnector::connect_from_env() {
    ConnectResult result;
    std::string error;
    auto endpoint = endpoint_from_env(error);
    if (!endpoint) {
        result.error = error;
        return result;
    }
    return connect(*endpoint);
}

ConnectResult HttpEngineConnector::connect_to_host(const std::string& host) {
    ConnectResult result;
    std::string error;
    auto endpoint = parse_engine_host(host, error);
    if (!endpoint) {
        result.error = error;
        return result;
    }
    return connect(*endpoint);
}

ConnectResult HttpEngineConnector::connect(const EngineEndpoint& endpoint) {
    ConnectResult result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "failed to initialise HTTP transport";
        return result;
    }
    result.client = std::make_unique<HttpEngineClient>(endpoint, curl);
    return result;
}

} // namespace dockbox::engine
