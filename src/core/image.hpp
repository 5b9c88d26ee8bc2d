#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace daybook {

enum class ImageType {
    Background,
    Inline
};

enum class ImagePendingOp {
    Upload,
    Delete
};

[[nodiscard]] constexpr const char* to_string(ImageType t) noexcept {
    return t == ImageType::Background ? "background" : "inline";
}

[[nodiscard]] constexpr const char* to_string(ImagePendingOp op) noexcept {
    return op == ImagePendingOp::Upload ? "upload" : "delete";
}

/**
 * Encrypted image blob. Ciphertext and nonce are base64.
 */
struct ImageRecord {
    int version{1};
    std::string id;
    std::string key_id;
    std::string ciphertext;
    std::string nonce;

    bool operator==(const ImageRecord&) const = default;
};

struct ImageMeta {
    std::string id;
    std::string note_date;
    ImageType type{ImageType::Inline};
    std::string filename;
    std::string mime_type;
    int width{0};
    int height{0};
    int64_t size{0};
    std::string created_at;
    std::string sha256;
    std::string key_id;
    std::optional<std::string> remote_path;
    std::optional<std::string> server_updated_at;
    std::optional<ImagePendingOp> pending_op;

    bool operator==(const ImageMeta&) const = default;
};

} // namespace daybook
