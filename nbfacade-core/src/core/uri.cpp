#include "nbfacade/uri.h"
#include <cctype>
#include <cstring>

namespace nbfacade {

namespace {

bool IsUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/' || c == ':';
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> StripScheme(const std::string& uri, const char* scheme) {
    const size_t len = std::strlen(scheme);
    if (uri.size() <= len || uri.compare(0, len, scheme) != 0) {
        return std::nullopt;
    }
    return uri.substr(len);
}

std::string NormalizedPath(const std::filesystem::path& path) {
    return path.lexically_normal().generic_string();
}

} // namespace

std::string PercentEncode(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (IsUnreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string PercentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = HexValue(text[i + 1]);
            int lo = HexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::string ToFileUri(const std::filesystem::path& path) {
    return std::string(UriScheme::FILE_PREFIX) + PercentEncode(NormalizedPath(path));
}

std::optional<std::filesystem::path> FromFileUri(const std::string& uri) {
    auto rest = StripScheme(uri, UriScheme::FILE_PREFIX);
    if (!rest) {
        return std::nullopt;
    }
    return std::filesystem::path(PercentDecode(*rest));
}

std::string ToPreviewUri(const std::filesystem::path& path) {
    return std::string(UriScheme::PREVIEW_PREFIX) + PercentEncode(NormalizedPath(path));
}

std::optional<std::filesystem::path> FromPreviewUri(const std::string& uri) {
    auto rest = StripScheme(uri, UriScheme::PREVIEW_PREFIX);
    if (!rest) {
        return std::nullopt;
    }
    return std::filesystem::path(PercentDecode(*rest));
}

std::string ToOverlayUri(const std::filesystem::path& path, const std::string& cell_id) {
    return std::string(UriScheme::OVERLAY_PREFIX) + PercentEncode(NormalizedPath(path)) + "#" + PercentEncode(cell_id);
}

std::optional<OverlayUriParts> FromOverlayUri(const std::string& uri) {
    auto rest = StripScheme(uri, UriScheme::OVERLAY_PREFIX);
    if (!rest) {
        return std::nullopt;
    }
    size_t hash = rest->rfind('#');
    if (hash == std::string::npos || hash == 0 || hash + 1 >= rest->size()) {
        return std::nullopt;
    }

    OverlayUriParts parts;
    parts.path = PercentDecode(rest->substr(0, hash));
    parts.cell_id = PercentDecode(rest->substr(hash + 1));
    return parts;
}

} // namespace nbfacade
