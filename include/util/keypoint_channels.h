#pragma once
#include <string>
#include <vector>

namespace util {

// Channel name for one keypoint axis: keypoint_channel(3, 'y') == "KP_3_y".
std::string keypoint_channel(int keypoint, char axis);

// KP_0_x, KP_0_y, KP_1_x, ... for `keypoints` keypoints.
std::vector<std::string> make_keypoint_channels(int keypoints);

} // namespace util
