#include "voice_bridge/persistence/rest_client.hpp"

#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {
namespace persistence {

RestClient::RestClient(std::string base_url,
                       std::map<std::string, std::string> default_headers,
                       RestRequestOptions options)
    : default_headers_(std::move(default_headers)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (base_path_ == "/") {
        base_path_.clear();
    }

    if (scheme_ == "https") {
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(true);
    } else if (scheme_ == "http") {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    } else {
        throw ConfigurationError("Unsupported persistence URL scheme: " + scheme_);
    }
    apply_timeouts();
}

nlohmann::json RestClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
    auto headers = make_headers(false);
    auto result = client_https_ ? client_https_->Get(full_path.c_str(), headers)
                                : client_http_->Get(full_path.c_str(), headers);
    return handle_response(result, "GET", path);
}

nlohmann::json RestClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    auto headers = make_headers(true);
    auto result = client_https_
                      ? client_https_->Post(full_path.c_str(), headers, body.dump(),
                                            "application/json")
                      : client_http_->Post(full_path.c_str(), headers, body.dump(),
                                           "application/json");
    return handle_response(result, "POST", path);
}

nlohmann::json RestClient::patch_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    auto headers = make_headers(true);
    auto result = client_https_
                      ? client_https_->Patch(full_path.c_str(), headers, body.dump(),
                                             "application/json")
                      : client_http_->Patch(full_path.c_str(), headers, body.dump(),
                                            "application/json");
    return handle_response(result, "PATCH", path);
}

httplib::Headers RestClient::make_headers(bool with_body) const {
    httplib::Headers headers{{"Accept", "application/json"}};
    for (const auto& [key, value] : default_headers_) {
        headers.emplace(key, value);
    }
    if (with_body) {
        headers.emplace("Prefer", "return=representation");
    }
    return headers;
}

nlohmann::json RestClient::handle_response(const httplib::Result& result,
                                           const std::string& method,
                                           const std::string& path) const {
    if (!result) {
        throw PersistenceError(method + " " + path + " failed: " +
                               httplib::to_string(result.error()));
    }
    const auto& response = result.value();
    if (response.status == 401 || response.status == 403) {
        throw PersistencePermissionError(response.body);
    }
    if (response.status < 200 || response.status >= 300) {
        logging::debug("Persistence request rejected",
                       {kv("method", method), kv("path", path), kv("status", response.status)});
        throw PersistenceError(method + " " + path + " returned " +
                               std::to_string(response.status) + ": " + response.body);
    }
    if (response.body.empty()) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw PersistenceError(method + " " + path + " returned invalid JSON: " + ex.what());
    }
}

std::string RestClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

void RestClient::apply_timeouts() {
    if (client_https_) {
        client_https_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_https_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_https_->set_write_timeout(options_.request_timeout.count(), 0);
        return;
    }
    client_http_->set_connection_timeout(options_.connect_timeout.count(), 0);
    client_http_->set_read_timeout(options_.sock_read_timeout.count(), 0);
    client_http_->set_write_timeout(options_.request_timeout.count(), 0);
}

}
}
