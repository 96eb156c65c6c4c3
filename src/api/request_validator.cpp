#include "api/request_validator.hpp"

#include <boost/beast/http/field.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>

namespace httpkv::api {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Media types are case-insensitive.
std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Number of continuation bytes implied by a UTF-8 lead byte, or -1 if the
// byte cannot start a sequence.
int utf8_trailing(unsigned char lead) noexcept {
    if (lead < 0x80) return 0;
    if (lead >= 0xC2 && lead <= 0xDF) return 1;
    if (lead >= 0xE0 && lead <= 0xEF) return 2;
    if (lead >= 0xF0 && lead <= 0xF4) return 3;
    return -1;
}

bool is_valid_utf8(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        const int n = utf8_trailing(lead);
        if (n < 0 || s.size() - i <= static_cast<std::size_t>(n)) {
            return false;
        }
        uint32_t cp = (n == 0) ? lead : (lead & (0x3Fu >> n));
        for (int k = 1; k <= n; ++k) {
            const auto c = static_cast<unsigned char>(s[i + static_cast<std::size_t>(k)]);
            if ((c & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (c & 0x3Fu);
        }
        // Reject overlongs, surrogates and values past U+10FFFF.
        if ((n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += static_cast<std::size_t>(n) + 1;
    }
    return true;
}

} // namespace

bool accepts_json(std::string_view accept) {
    if (trim(accept).empty()) {
        return true;
    }
    while (!accept.empty()) {
        const auto comma = accept.find(',');
        std::string_view range = accept.substr(0, comma);
        accept = (comma == std::string_view::npos) ? std::string_view{} : accept.substr(comma + 1);

        // Drop parameters such as ";q=0.5".
        range = trim(range.substr(0, range.find(';')));
        const std::string lowered = to_lower(range);
        if (lowered == kJsonMediaType || lowered == "*/*") {
            return true;
        }
    }
    return false;
}

bool is_json_content_type(std::string_view content_type) {
    return to_lower(content_type).find(kJsonMediaType) != std::string::npos;
}

std::string decode_utf8_body(std::string_view raw) {
    if (!is_valid_utf8(raw)) {
        return {};
    }
    return std::string(raw);
}

nlohmann::ordered_json parse_json_object(std::string_view text) {
    auto parsed = nlohmann::ordered_json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_object()) {
        // Covers discarded (parse error), null, and scalar/array bodies.
        return nlohmann::ordered_json::object();
    }
    return parsed;
}

ValidationResult validate_json_request(const Request& req,
                                       const std::vector<std::string>& expected_params) {
    const bool has_length = req.find(http::field::content_length) != req.end();
    const std::string body = decode_utf8_body(req.body());

    const bool json_accepted = accepts_json(to_string_view(req[http::field::accept]));
    const bool json_content  = is_json_content_type(to_string_view(req[http::field::content_type]));

    if (!has_length || !json_accepted || !json_content) {
        return ValidationError{std::string(kNotJsonRequestMessage)};
    }

    nlohmann::ordered_json payload = parse_json_object(body);

    const bool complete = std::all_of(
        expected_params.begin(), expected_params.end(),
        [&payload](const std::string& param) { return payload.contains(param); });

    if (!complete) {
        nlohmann::ordered_json found = nlohmann::ordered_json::array();
        for (const auto& [name, _] : payload.items()) {
            found.push_back(name);
        }
        const nlohmann::ordered_json expected = expected_params;
        return ValidationError{std::format(
            "Request is missing parameters. Expected: {}, Found: {}",
            expected.dump(), found.dump())};
    }

    return payload;
}

ValidationResult validate_json_request(const Request& req, std::string_view expected_param) {
    return validate_json_request(req, std::vector<std::string>{std::string(expected_param)});
}

} // namespace httpkv::api
