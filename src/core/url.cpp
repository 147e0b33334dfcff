#include <rdf_sync/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace rdf_sync {

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string EndpointUrl::Origin() const {
    return std::string(use_https ? "https://" : "http://") + host + ":" +
           std::to_string(port);
}

std::string EndpointUrl::ToString() const {
    return Origin() + path;
}

Result<EndpointUrl, std::string> ParseEndpointUrl(std::string_view url) {
    using R = Result<EndpointUrl, std::string>;

    EndpointUrl out;
    std::string_view rest;
    if (url.substr(0, 8) == "https://") {
        out.use_https = true;
        out.port = 443;
        rest = url.substr(8);
    } else if (url.substr(0, 7) == "http://") {
        rest = url.substr(7);
    } else {
        return R::Err("Endpoint URL must start with http:// or https://");
    }

    if (rest.find_first_of("?#") != std::string_view::npos) {
        return R::Err("Endpoint URL must not contain a query string or fragment");
    }

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.path = std::string(rest.substr(slash));
    }
    if (authority.empty()) {
        return R::Err("Endpoint URL has no host");
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5) {
            return R::Err("Invalid port in endpoint URL");
        }
        int port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return R::Err("Invalid port in endpoint URL");
            }
            port = port * 10 + (c - '0');
        }
        if (port == 0 || port > 65535) {
            return R::Err("Port out of range in endpoint URL");
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return R::Err("Endpoint URL has no host");
    }
    out.host = std::string(authority);
    return R::Ok(std::move(out));
}

} // namespace rdf_sync
