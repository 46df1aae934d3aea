#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace warden::oauth {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string content_type;
};

struct HttpResponse {
    bool success = false;   // A response was received (any status)
    int status = 0;
    std::string body;
    std::string error;      // Transport failure when success == false
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded body
std::string form_encode(const FormFields& fields);

// Percent-encode per RFC 3986 unreserved set
std::string url_encode(const std::string& value);

// Outbound HTTP seam used by the OAuth broker
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;

    HttpResponse post_form(const std::string& url, const FormFields& fields,
                           const std::map<std::string, std::string>& headers = {});
};

// cpp-httplib client, one connection per request
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(int timeout_seconds = 30);

    HttpResponse send(const HttpRequest& request) override;

private:
    int timeout_seconds_;
};

} // namespace warden::oauth
