#pragma once

#include <string>

namespace voice_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string url_encode(const std::string& value);

std::string xml_escape(const std::string& value);

}
