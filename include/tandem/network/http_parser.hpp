#pragma once

#include "tandem/core/result.hpp"
#include "tandem/network/http_types.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>

namespace tandem::network {

/**
 * @brief Where the parser is within the request
 *
 * METHOD SP URL SP VERSION CRLF
 * Header-Name: Header-Value CRLF
 * CRLF
 * [Body]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR  // ERROR collides with a Windows macro
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data may arrive in arbitrary chunks; feed each one to parse(). Once it
 * returns true, consumed() tells how many bytes of the last chunk belonged
 * to this request so a keep-alive connection can hand the rest to the
 * next one.
 *
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(data, len);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kDefaultMaxBody = 64 * 1024;

    explicit HttpParser(std::size_t max_body_bytes = kDefaultMaxBody)
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @return true once a full request is available, false if more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len) {
        consumed_ = 0;
        for (std::size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }

            char c = data[i];
            ++consumed_;
            if (c == '\n') {
                line_++;
            }

            switch (state_) {
                case ParseState::METHOD:
                    if (!parse_method(c)) {
                        return fail("Failed to parse HTTP method at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::URL:
                    if (!parse_url(c)) {
                        return fail("Failed to parse URL at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::VERSION:
                    if (!parse_version(c)) {
                        return fail("Failed to parse HTTP version at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::HEADER_NAME:
                    if (!parse_header_name(c)) {
                        return fail(error_.empty() ? "Failed to parse header name at line " + std::to_string(line_)
                                                   : error_);
                    }
                    break;

                case ParseState::HEADER_VALUE:
                    if (!parse_header_value(c)) {
                        return fail("Failed to parse header value at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::BODY:
                    parse_body(c);
                    break;

                case ParseState::COMPLETE:
                    return Ok(true);

                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorCode::InvalidMessage, "Parser in error state");
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// True when the failure was an oversized body rather than bad syntax.
    bool body_too_large() const {
        return body_too_large_;
    }

    /// Bytes of the most recent parse() input that were used.
    std::size_t consumed() const {
        return consumed_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        body_length_ = 0;
        body_bytes_read_ = 0;
        consumed_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

    /**
     * @brief Split "a=1&b=two%20words" into a map, decoding %XX and '+'
     */
    static std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
        std::unordered_map<std::string, std::string> result;
        std::size_t start = 0;
        while (start <= query.size()) {
            auto end = query.find('&', start);
            if (end == std::string::npos) {
                end = query.size();
            }
            auto pair = query.substr(start, end - start);
            if (!pair.empty()) {
                auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    result[url_decode(pair)] = "";
                } else {
                    result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
                }
            }
            start = end + 1;
        }
        return result;
    }

    static std::string url_decode(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '+') {
                out += ' ';
            } else if (text[i] == '%' && i + 2 < text.size() &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
                out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += text[i];
            }
        }
        return out;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    std::size_t max_body_bytes_;
    std::size_t body_length_;
    std::size_t body_bytes_read_;
    std::size_t consumed_;
    std::size_t line_;
    bool last_char_was_cr_;
    bool body_too_large_;

    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool>(ErrorCode::InvalidMessage, std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            auto question = buffer_.find('?');
            if (question == std::string::npos) {
                request_.path = buffer_;
            } else {
                request_.path = buffer_.substr(0, question);
                request_.query = parse_query(buffer_.substr(question + 1));
            }
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Blank line: headers done
            last_char_was_cr_ = false;
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::size_t length = 0;
        const auto* first = content_length.data();
        const auto* last = first + content_length.size();
        auto [ptr, ec] = std::from_chars(first, last, length);
        if (ec != std::errc() || ptr != last) {
            error_ = "Invalid Content-Length: " + content_length;
            return false;
        }
        if (length > max_body_bytes_) {
            body_too_large_ = true;
            error_ = "Request body of " + content_length + " bytes exceeds limit";
            return false;
        }
        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        body_length_ = length;
        request_.body.reserve(length);
        state_ = ParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        request_.body.push_back(static_cast<uint8_t>(c));
        body_bytes_read_++;
        if (body_bytes_read_ >= body_length_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

} // namespace tandem::network
