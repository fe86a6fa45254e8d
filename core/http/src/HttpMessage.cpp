#include "HttpMessage.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace SkipKP {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseContentLength(const std::string& value, std::size_t& out) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(value));
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

} // namespace

bool urlDecode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return true;
}

std::string HttpRequest::queryParam(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? std::string() : it->second;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

skp::Result<std::size_t> HttpRequest::expectedSize(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return static_cast<std::size_t>(0);
    }

    std::size_t length = 0;
    std::string lowered = lower(raw.substr(0, headerEnd + 2));
    auto pos = lowered.find("\r\ncontent-length:");
    if (pos != std::string::npos) {
        pos += 17;
        auto end = lowered.find("\r\n", pos);
        if (!parseContentLength(trim(lowered.substr(pos, end - pos)), length)) {
            return skp::Err<std::size_t>(skp::ErrorCode::ValidationError, "Invalid Content-Length");
        }
    }
    return headerEnd + 4 + length;
}

skp::Result<HttpRequest> HttpRequest::parse(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Incomplete request");
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string requestLine;
    std::getline(head, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    // METHOD SP target SP HTTP/x.y
    auto firstSpace = requestLine.find(' ');
    auto lastSpace = requestLine.rfind(' ');
    if (firstSpace == std::string::npos || lastSpace == firstSpace ||
        requestLine.compare(lastSpace + 1, 5, "HTTP/") != 0) {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Malformed request line");
    }

    HttpRequest request;
    request.method = requestLine.substr(0, firstSpace);
    std::string target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
    if (target.empty() || target[0] != '/') {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Malformed request target");
    }

    std::string rawQuery;
    auto questionMark = target.find('?');
    if (questionMark != std::string::npos) {
        rawQuery = target.substr(questionMark + 1);
        target.resize(questionMark);
    }
    if (!urlDecode(target, request.path)) {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Malformed request path");
    }

    std::size_t start = 0;
    while (!rawQuery.empty()) {
        auto amp = rawQuery.find('&', start);
        std::string pair = rawQuery.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string name, value;
            if (!urlDecode(pair.substr(0, eq), name) ||
                !urlDecode(eq == std::string::npos ? std::string() : pair.substr(eq + 1), value)) {
                return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Malformed query string");
            }
            request.query.emplace(std::move(name), std::move(value));
        }
        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Malformed header");
        }
        request.headers.emplace(lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
    }

    std::size_t length = 0;
    auto contentLength = request.headers.find("content-length");
    if (contentLength != request.headers.end() && !parseContentLength(contentLength->second, length)) {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Invalid Content-Length");
    }
    if (raw.size() < headerEnd + 4 + length) {
        return skp::Err<HttpRequest>(skp::ErrorCode::ValidationError, "Truncated body");
    }
    request.body = raw.substr(headerEnd + 4, length);
    return request;
}

const char* httpStatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

HttpResponse HttpResponse::json(int status, const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    HttpResponse response;
    response.status = status;
    response.body = Json::writeString(builder, value);
    return response;
}

HttpResponse HttpResponse::error(int status, const std::string& reason) {
    Json::Value body;
    body["error"] = reason;
    return json(status, body);
}

std::string HttpResponse::serialize() const {
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + httpStatusText(status) + "\r\n";
    head += "Content-Type: " + contentType + "\r\n";
    head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    head += "Cache-Control: no-store\r\n";
    head += "Connection: close\r\n\r\n";

    std::string wire;
    wire.reserve(head.size() + body.size());
    wire += head;
    wire += body;
    return wire;
}

} // namespace SkipKP
