#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "oauth/http_transport.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <cstdio>

namespace warden::oauth {

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string form_encode(const FormFields& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += url_encode(key) + "=" + url_encode(value);
    }
    return body;
}

HttpResponse HttpTransport::post_form(const std::string& url, const FormFields& fields,
                                      const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers = headers;
    request.headers.emplace("Accept", "application/json");
    request.body = form_encode(fields);
    request.content_type = "application/x-www-form-urlencoded";
    return send(request);
}

HttplibTransport::HttplibTransport(int timeout_seconds) : timeout_seconds_(timeout_seconds) {}

HttpResponse HttplibTransport::send(const HttpRequest& request) {
    HttpResponse response;

    // Split "scheme://host[:port]/path?query"
    auto scheme_end = request.url.find("://");
    if (scheme_end == std::string::npos) {
        response.error = "invalid URL: " + request.url;
        return response;
    }
    auto path_start = request.url.find('/', scheme_end + 3);
    std::string origin = request.url.substr(0, path_start);
    std::string path = path_start == std::string::npos ? "/" : request.url.substr(path_start);

    try {
        httplib::Client cli(origin);
        cli.set_connection_timeout(timeout_seconds_);
        cli.set_read_timeout(timeout_seconds_);
        cli.set_write_timeout(timeout_seconds_);

        httplib::Headers headers;
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        if (request.method != "GET" && request.method != "POST" &&
            request.method != "PUT" && request.method != "DELETE") {
            response.error = "unsupported HTTP method: " + request.method;
            return response;
        }

        auto result = [&]() {
            if (request.method == "GET") return cli.Get(path, headers);
            if (request.method == "PUT") return cli.Put(path, headers, request.body, request.content_type);
            if (request.method == "DELETE") return cli.Delete(path, headers, request.body, request.content_type);
            return cli.Post(path, headers, request.body, request.content_type);
        }();

        if (!result) {
            response.error = "HTTP request failed: " + httplib::to_string(result.error());
            spdlog::error("{} {} failed: {}", request.method, origin, response.error);
            return response;
        }

        spdlog::debug("{} {} -> {} ({}B)", request.method, origin + path, result->status, result->body.size());
        response.success = true;
        response.status = result->status;
        response.body = result->body;
    } catch (const std::exception& e) {
        response.success = false;
        response.error = std::string("Exception: ") + e.what();
        spdlog::error("HTTP exception: {}", e.what());
    }

    return response;
}

} // namespace warden::oauth
