#pragma once

/**
 * @file HttpMessage.h
 * @brief Minimal HTTP/1.1 request parsing and response rendering
 */

#include "Result.h"

#include <json/json.h>

#include <cstddef>
#include <map>
#include <string>

namespace SkipKP {

struct HttpRequest {
    std::string method;
    std::string path;                              // without the query string
    std::map<std::string, std::string> query;      // decoded; first occurrence wins
    std::map<std::string, std::string> headers;    // names lowercased
    std::string body;

    bool hasQuery(const std::string& name) const { return query.count(name) > 0; }
    std::string queryParam(const std::string& name) const;
    std::string header(const std::string& name) const;

    /// ValidationError on a malformed request line, header or Content-Length
    static skp::Result<HttpRequest> parse(const std::string& raw);

    /**
     * @brief Total bytes the request in @p raw will occupy
     * @return 0 while the header block is still incomplete
     */
    static skp::Result<std::size_t> expectedSize(const std::string& raw);
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";
    bool sensitive = false;                        // body holds key material

    static HttpResponse json(int status, const Json::Value& value);
    static HttpResponse error(int status, const std::string& reason);

    std::string serialize() const;
};

const char* httpStatusText(int status);

/// Percent-decoding with '+' as space. @return false on a bad escape
bool urlDecode(const std::string& in, std::string& out);

} // namespace SkipKP
