#pragma once

#include "api_export.h"
#include <filesystem>
#include <optional>
#include <string>

namespace nbfacade {

// Identity schemes
namespace UriScheme {
    constexpr const char* FILE_PREFIX = "file://";
    constexpr const char* PREVIEW_PREFIX = "nb://";        // read-only rendering of a human view
    constexpr const char* OVERLAY_PREFIX = "nb-cell://";   // edit overlay of one cell
}

struct OverlayUriParts {
    std::filesystem::path path;
    std::string cell_id;
};

NBFACADE_API std::string PercentEncode(const std::string& text);
NBFACADE_API std::string PercentDecode(const std::string& text);

// file:///abs/path
NBFACADE_API std::string ToFileUri(const std::filesystem::path& path);
NBFACADE_API std::optional<std::filesystem::path> FromFileUri(const std::string& uri);

// nb:///abs/path
NBFACADE_API std::string ToPreviewUri(const std::filesystem::path& path);
NBFACADE_API std::optional<std::filesystem::path> FromPreviewUri(const std::string& uri);

// nb-cell:///abs/path#cell-id
NBFACADE_API std::string ToOverlayUri(const std::filesystem::path& path, const std::string& cell_id);
NBFACADE_API std::optional<OverlayUriParts> FromOverlayUri(const std::string& uri);

} // namespace nbfacade
