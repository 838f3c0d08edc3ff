#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace protocol {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

// Request headers: one value per name, name lookup ignores case.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Response headers keep order and repeated names (Set-Cookie).
using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

inline bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// RFC 7230 token characters.
inline bool IsValidHeaderName(const std::string& name) {
    if (name.empty()) return false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) continue;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'':
            case '*': case '+': case '-': case '.': case '^': case '_':
            case '`': case '|': case '~':
                continue;
            default:
                return false;
        }
    }
    return true;
}

// Rejects values that would split or truncate the header block.
inline bool IsValidHeaderValue(const std::string& value) {
    for (unsigned char c : value) {
        if (c == '\r' || c == '\n' || c == '\0') return false;
    }
    return true;
}

inline const std::string* FindHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (IEquals(h.first, name)) return &h.second;
    }
    return nullptr;
}

inline void RemoveHeader(HeaderList* headers, const std::string& name) {
    headers->erase(std::remove_if(headers->begin(), headers->end(),
                                  [&name](const std::pair<std::string, std::string>& h) {
                                      return IEquals(h.first, name);
                                  }),
                   headers->end());
}

} // namespace protocol
} // namespace relay
