/**
 * @file http_message.cpp
 * @brief HTTP/1.1 message parsing and serialization.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/net/http_message.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace crossmesh {
namespace net {

namespace {

bool allDigits(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool allHexDigits(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitLines(const std::string& head) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= head.size()) {
        size_t eol = head.find("\r\n", pos);
        if (eol == std::string::npos) {
            lines.push_back(head.substr(pos));
            break;
        }
        lines.push_back(head.substr(pos, eol - pos));
        pos = eol + 2;
    }
    return lines;
}

bool parseHeaderLines(const std::vector<std::string>& lines, HttpHeaders& headers) {
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            continue;
        }
        auto colon = lines[i].find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        headers.emplace_back(trim(lines[i].substr(0, colon)), trim(lines[i].substr(colon + 1)));
    }
    return true;
}

void writeHeaders(std::ostringstream& oss, const HttpHeaders& headers, size_t bodySize) {
    bool haveLength = false;
    for (const auto& [name, value] : headers) {
        if (iequals(name, "Transfer-Encoding")) {
            continue;  // bodies are always re-framed with Content-Length
        }
        if (iequals(name, "Content-Length")) {
            haveLength = true;
            oss << name << ": " << bodySize << "\r\n";
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!haveLength) {
        oss << "Content-Length: " << bodySize << "\r\n";
    }
    oss << "\r\n";
}

bool bodyForbidden(const std::string& requestMethod, int status) {
    return requestMethod == "HEAD" || (status >= 100 && status < 200) ||
           status == 204 || status == 304;
}

}  // namespace

const std::string* findHeader(const HttpHeaders& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (iequals(header.first, name)) {
            return &header.second;
        }
    }
    return nullptr;
}

void setHeader(HttpHeaders& headers, const std::string& name, const std::string& value) {
    for (auto& header : headers) {
        if (iequals(header.first, name)) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

void removeHeader(HttpHeaders& headers, const std::string& name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const auto& h) { return iequals(h.first, name); }),
                  headers.end());
}

std::string HttpRequest::authority() const {
    static const std::string scheme = "http://";
    if (target.compare(0, scheme.size(), scheme) == 0) {
        auto slash = target.find('/', scheme.size());
        return target.substr(scheme.size(), slash == std::string::npos
                                                ? std::string::npos
                                                : slash - scheme.size());
    }
    if (method == "CONNECT") {
        return target;
    }
    const std::string* host = findHeader(headers, "Host");
    return host ? *host : std::string();
}

std::string HttpRequest::path() const {
    static const std::string scheme = "http://";
    if (target.compare(0, scheme.size(), scheme) == 0) {
        auto slash = target.find('/', scheme.size());
        return slash == std::string::npos ? "/" : target.substr(slash);
    }
    return target.empty() ? "/" : target;
}

std::string HttpRequest::serialize() const {
    std::ostringstream oss;
    oss << method << " " << target << " " << version << "\r\n";
    writeHeaders(oss, headers, body.size());
    oss << body;
    return oss.str();
}

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << version << " " << status << " " << reason << "\r\n";
    writeHeaders(oss, headers, body.size());
    oss << body;
    return oss.str();
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

bool parseRequestHead(const std::string& head, HttpRequest& out) {
    auto lines = splitLines(head);
    if (lines.empty()) {
        return false;
    }

    std::istringstream start(lines[0]);
    if (!(start >> out.method >> out.target >> out.version)) {
        return false;
    }
    if (out.version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }
    out.headers.clear();
    return parseHeaderLines(lines, out.headers);
}

bool parseResponseHead(const std::string& head, HttpResponse& out) {
    auto lines = splitLines(head);
    if (lines.empty()) {
        return false;
    }

    const std::string& line = lines[0];
    auto firstSpace = line.find(' ');
    if (firstSpace == std::string::npos) {
        return false;
    }
    out.version = line.substr(0, firstSpace);
    if (out.version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    auto secondSpace = line.find(' ', firstSpace + 1);
    std::string code = line.substr(firstSpace + 1, secondSpace == std::string::npos
                                                       ? std::string::npos
                                                       : secondSpace - firstSpace - 1);
    if (code.size() != 3 || !allDigits(code)) {
        return false;
    }
    out.status = std::stoi(code);
    out.reason = secondSpace == std::string::npos ? "" : line.substr(secondSpace + 1);
    out.headers.clear();
    return parseHeaderLines(lines, out.headers);
}

int decodeChunked(const std::string& input, std::string& out, size_t& consumed) {
    out.clear();
    size_t pos = 0;

    while (true) {
        size_t eol = input.find("\r\n", pos);
        if (eol == std::string::npos) {
            return 0;
        }

        std::string sizeText = input.substr(pos, eol - pos);
        auto ext = sizeText.find(';');
        if (ext != std::string::npos) {
            sizeText = sizeText.substr(0, ext);
        }
        sizeText = trim(sizeText);
        if (sizeText.empty() || !allHexDigits(sizeText) ||
            sizeText.size() > 8) {
            return -1;
        }
        size_t chunkSize = std::stoul(sizeText, nullptr, 16);
        pos = eol + 2;

        if (chunkSize == 0) {
            // Skip trailer headers up to the blank line.
            while (true) {
                size_t trailerEnd = input.find("\r\n", pos);
                if (trailerEnd == std::string::npos) {
                    return 0;
                }
                bool blank = trailerEnd == pos;
                pos = trailerEnd + 2;
                if (blank) {
                    consumed = pos;
                    return 1;
                }
            }
        }

        if (out.size() + chunkSize > MAX_HTTP_BODY_BYTES) {
            return -1;
        }
        if (input.size() < pos + chunkSize + 2) {
            return 0;
        }
        out.append(input, pos, chunkSize);
        pos += chunkSize;
        if (input.compare(pos, 2, "\r\n") != 0) {
            return -1;
        }
        pos += 2;
    }
}

// =============================================================================
// HttpConnection
// =============================================================================

namespace {

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

bool HttpConnection::fill(int timeoutMs, bool& eof) {
    char chunk[8192];
    int received = socket_.receive(chunk, sizeof(chunk), timeoutMs);
    if (received > 0) {
        buffer_.append(chunk, static_cast<size_t>(received));
        return true;
    }
    eof = socket_.isPeerClosed();
    return false;
}

bool HttpConnection::readHead(std::string& head, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        auto end = buffer_.find("\r\n\r\n");
        if (end != std::string::npos) {
            head = buffer_.substr(0, end);
            buffer_.erase(0, end + 4);
            return true;
        }
        if (buffer_.size() > MAX_HTTP_HEADER_BYTES) {
            LOG_WARN("HttpConnection", "Header block exceeds {} bytes", MAX_HTTP_HEADER_BYTES);
            return false;
        }
        int left = remainingMs(deadline);
        bool eof = false;
        if (left == 0 || !fill(left, eof)) {
            return false;
        }
    }
}

bool HttpConnection::readBody(const HttpHeaders& headers, bool untilClose,
                              std::string& body, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    body.clear();

    const std::string* encoding = findHeader(headers, "Transfer-Encoding");
    if (encoding && encoding->find("chunked") != std::string::npos) {
        while (true) {
            size_t consumed = 0;
            int rc = decodeChunked(buffer_, body, consumed);
            if (rc < 0) {
                return false;
            }
            if (rc > 0) {
                buffer_.erase(0, consumed);
                return true;
            }
            int left = remainingMs(deadline);
            bool eof = false;
            if (left == 0 || !fill(left, eof)) {
                return false;
            }
        }
    }

    const std::string* lengthHeader = findHeader(headers, "Content-Length");
    if (lengthHeader) {
        size_t length = 0;
        try {
            length = std::stoul(*lengthHeader);
        } catch (const std::exception&) {
            return false;
        }
        if (length > MAX_HTTP_BODY_BYTES) {
            return false;
        }
        while (buffer_.size() < length) {
            int left = remainingMs(deadline);
            bool eof = false;
            if (left == 0 || !fill(left, eof)) {
                return false;
            }
        }
        body = buffer_.substr(0, length);
        buffer_.erase(0, length);
        return true;
    }

    if (!untilClose) {
        return true;
    }

    while (true) {
        int left = remainingMs(deadline);
        bool eof = false;
        if (left == 0) {
            return false;
        }
        if (!fill(left, eof)) {
            if (eof) {
                body.swap(buffer_);
                buffer_.clear();
                return true;
            }
            return false;
        }
        if (buffer_.size() > MAX_HTTP_BODY_BYTES) {
            return false;
        }
    }
}

bool HttpConnection::readRequest(HttpRequest& request, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    std::string head;
    if (!readHead(head, timeoutMs)) {
        return false;
    }
    if (!parseRequestHead(head, request)) {
        LOG_DEBUG("HttpConnection", "Malformed request head");
        return false;
    }
    return readBody(request.headers, false, request.body, remainingMs(deadline));
}

bool HttpConnection::readResponse(HttpResponse& response, const std::string& requestMethod,
                                  int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    std::string head;
    if (!readHead(head, timeoutMs)) {
        return false;
    }
    if (!parseResponseHead(head, response)) {
        LOG_DEBUG("HttpConnection", "Malformed response head");
        return false;
    }
    if (bodyForbidden(requestMethod, response.status)) {
        response.body.clear();
        return true;
    }
    return readBody(response.headers, true, response.body, remainingMs(deadline));
}

bool HttpConnection::writeRequest(const HttpRequest& request, int timeoutMs) {
    return socket_.sendAll(request.serialize(), timeoutMs);
}

bool HttpConnection::writeResponse(const HttpResponse& response, int timeoutMs) {
    return socket_.sendAll(response.serialize(), timeoutMs);
}

}  // namespace net
}  // namespace crossmesh
