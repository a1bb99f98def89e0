#include "ResponseParser.h"
#include <array>
#include <cctype>
#include <utility>

namespace iperf_discovery {

namespace {
    bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

    std::string_view trim(std::string_view s) {
        size_t b = 0, e = s.size();
        while(b < e && is_space(s[b])) ++b;
        while(e > b && is_space(s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    void replace_all(std::string& s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
    }

    // Firmware label -> attribute key. Applied in order.
    const std::array<std::pair<std::string_view, std::string_view>, 10> FIRMWARE_LABELS = {{
        {"ethaddr=", "MAC="},
        {"PS9: ", "Batt="},
        {"PS8: ", "PoeV="},
        {"EtherType: ", "NsType="},
        {"Device ID: ", "NsDev="},
        {"Addresses: ", "NsAddr="},
        {"Platform: ", "NsPlatform="},
        {"Port ID: ", "NsPort="},
        {"Vlan ID:", "NsVlan="},
        {"\\n", ";"},
    }};
}

namespace response_grammar {

std::vector<std::string_view> tokenize(std::string_view text) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while(start <= text.size()) {
        size_t end = text.find(PAIR_DELIMITER, start);
        if(end == std::string_view::npos) end = text.size();
        auto seg = trim(text.substr(start, end - start));
        if(!seg.empty()) segments.push_back(seg);
        start = end + 1;
    }
    return segments;
}

std::optional<std::pair<std::string, std::string>> build_pair(std::string_view segment) {
    auto sep = segment.find(KEY_VALUE_SEPARATOR);
    if(sep == std::string_view::npos) return std::nullopt;
    auto key = trim(segment.substr(0, sep));
    if(key.empty()) return std::nullopt;
    auto value = trim(segment.substr(sep + 1));
    return std::make_pair(std::string(key), std::string(value));
}

}

std::optional<Attributes> parse_response(std::string_view bytes) {
    Attributes attrs;
    for(auto seg : response_grammar::tokenize(bytes)) {
        auto kv = response_grammar::build_pair(seg);
        if(!kv) continue;
        bool replaced = false;
        for(auto& existing : attrs) {
            if(existing.first == kv->first) { existing.second = std::move(kv->second); replaced = true; break; }
        }
        if(!replaced) attrs.push_back(std::move(*kv));
    }
    if(attrs.empty()) return std::nullopt;
    return attrs;
}

std::optional<std::string> normalize_firmware_reply(std::string_view raw) {
    if(!is_valid_utf8(raw)) return std::nullopt;
    std::string out;
    out.reserve(raw.size());
    bool pending_space = false;
    for(char c : trim(raw)) {
        if(is_space(c)) { pending_space = true; continue; }
        if(pending_space) { out.push_back(' '); pending_space = false; }
        out.push_back(c);
    }
    for(const auto& [from, to] : FIRMWARE_LABELS) replace_all(out, from, to);
    return out;
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while(i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if(c < 0x80) { ++i; continue; }
        size_t len = 0; uint32_t cp = 0; uint32_t min = 0;
        if((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
        else if((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
        else if((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
        else return false;
        if(i + len > n) return false;
        for(size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if(cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

}
