// File: processing/image/comparator.hpp

#ifndef IMAGE_COMPARATOR_HPP
#define IMAGE_COMPARATOR_HPP

#include <memory>
#include <string>

#include "types/image.hpp"
#include "types/image_comparison_result.hpp"

namespace processing::image {

    class ImageComparator {
    public:
        virtual ~ImageComparator() = default;

        // Compare two same-sized images. The score is a dissimilarity: 0 means pixel-identical.
        [[nodiscard]] virtual types::ImageComparisonResult compare(const types::NormalizedImage &image1,
                                                                   const types::NormalizedImage &image2) const = 0;

        // Comparator named by "comparison.method" (default "rms").
        static std::shared_ptr<ImageComparator> create();

        // Throws common::ConfigurationError for an unknown method name.
        static std::shared_ptr<ImageComparator> create(std::string method);
    };

} // namespace processing::image

#endif // IMAGE_COMPARATOR_HPP
