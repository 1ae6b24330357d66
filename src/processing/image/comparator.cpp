// File: processing/image/comparator.cpp

#include "processing/image/comparator.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
#include <unordered_map>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "processing/image/comparison/rms_comparator.hpp"

namespace processing::image {

    std::shared_ptr<ImageComparator> ImageComparator::create() {
        return create(config::get("comparison.method", "rms"));
    }

    std::shared_ptr<ImageComparator> ImageComparator::create(std::string method) {
        static const std::unordered_map<std::string_view, std::function<std::shared_ptr<ImageComparator>()>> map{
                {"rms", [] { return std::make_shared<RMSComparator>(); }}};

        std::ranges::transform(method, method.begin(), [](const unsigned char c) { return std::tolower(c); });

        const auto it = map.find(method);
        if (it == map.end()) {
            LOG_ERROR("Invalid comparison method '{}'", method);
            throw common::ConfigurationError(fmt::format("Unknown comparison method '{}' (expected rms)", method));
        }

        LOG_INFO("Using {} image comparator.", method);
        return it->second();
    }

} // namespace processing::image
