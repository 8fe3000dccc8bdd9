#include "atx/transfer/types.hpp"

namespace atx::transfer {

bool is_preview_key(std::string_view key) noexcept {
    return key.find(kPreviewMarker) != std::string_view::npos;
}

std::string_view upload_type_name(UploadType type) noexcept {
    switch (type) {
        case UploadType::AssetFile: return "assetFile";
        case UploadType::AssetPreview: return "assetPreview";
    }
    return "assetFile";
}

} // namespace atx::transfer
