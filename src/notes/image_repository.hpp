#pragma once

#include "core/errors.hpp"
#include "core/image.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/e2ee_service.hpp"
#include "storage/local_store.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace daybook::notes {

/**
 * Input for ImageRepository::store().
 */
struct NewImage {
    std::string note_date;
    ImageType type{ImageType::Inline};
    std::string filename;
    std::string mime_type;
    int width{0};
    int height{0};
    std::vector<uint8_t> bytes;
};

/**
 * ImageRepository - encrypted images attached to notes.
 *
 * New images are marked for upload; removing an uploaded image leaves a
 * meta row marked for remote deletion.
 */
class ImageRepository {
public:
    ImageRepository(std::shared_ptr<storage::LocalStore> store,
                    std::shared_ptr<crypto::E2eeService> e2ee,
                    ClockFn clock = system_clock());

    [[nodiscard]] Result<ImageMeta, RepositoryError> store(const NewImage& image);

    /**
     * Decrypted bytes, verified against the recorded digest. ok(nullopt)
     * when the image is unknown or its key is unavailable.
     */
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, RepositoryError> load(
        const std::string& id);

    [[nodiscard]] Result<void, RepositoryError> remove(const std::string& id);

    [[nodiscard]] Result<std::vector<ImageMeta>, RepositoryError> images_for_note(
        const std::string& note_date);

private:
    std::shared_ptr<storage::LocalStore> store_;
    std::shared_ptr<crypto::E2eeService> e2ee_;
    ClockFn clock_;
};

} // namespace daybook::notes
