#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "annotation/BoundingBox.hpp"
#include "config/Config.hpp"

namespace report {

struct ClassStatistics {
    std::size_t boxes{0};
    std::size_t images{0};
    std::size_t small{0};
    std::size_t medium{0};
    std::size_t large{0};
};

struct BoxStatistics {
    std::size_t totalBoxes{0};
    std::size_t totalImages{0};
    std::map<std::string, ClassStatistics> perClass;
    std::map<std::string, std::size_t> boxesPerImage;
};

// Size buckets follow the COCO breakpoints in `coco`.
BoxStatistics computeStatistics(
    const std::vector<annotation::BoundingBox>& boxes,
    const config::CocoConfig& coco = {});

void printStatistics(std::ostream& os, const BoxStatistics& statistics);

}  // namespace report
