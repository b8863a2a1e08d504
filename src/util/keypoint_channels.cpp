#include "util/keypoint_channels.h"
#include <stdexcept>

namespace util {

std::string keypoint_channel(int keypoint, char axis) {
    if (keypoint < 0) {
        throw std::invalid_argument("keypoint index must be >= 0");
    }
    if (axis != 'x' && axis != 'y') {
        throw std::invalid_argument(std::string("keypoint axis must be 'x' or 'y', got '") + axis + "'");
    }
    return "KP_" + std::to_string(keypoint) + "_" + axis;
}

std::vector<std::string> make_keypoint_channels(int keypoints) {
    std::vector<std::string> names;
    if (keypoints <= 0) return names;
    names.reserve(static_cast<size_t>(keypoints) * 2);
    for (int kp = 0; kp < keypoints; ++kp) {
        names.push_back(keypoint_channel(kp, 'x'));
        names.push_back(keypoint_channel(kp, 'y'));
    }
    return names;
}

} // namespace util
