#pragma once

#include <chrono>
#include <httplib.h>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace persistence {

struct RestRequestOptions {
    std::chrono::seconds request_timeout{10};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds sock_read_timeout{10};
};

// JSON client for a PostgREST endpoint. Non-2xx replies throw
// PersistenceError; 401/403 throw PersistencePermissionError.
class RestClient {
public:
    RestClient(std::string base_url,
               std::map<std::string, std::string> default_headers,
               RestRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json patch_json(const std::string& path, const nlohmann::json& body);

private:
    httplib::Headers make_headers(bool with_body) const;
    nlohmann::json handle_response(const httplib::Result& result,
                                   const std::string& method,
                                   const std::string& path) const;
    std::string build_path(const std::string& path) const;
    void apply_timeouts();

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::map<std::string, std::string> default_headers_;
    RestRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
    std::unique_ptr<httplib::SSLClient> client_https_;
};

}
}
