#include "rgbd_recorder/recorder_node.hpp"
#include <rclcpp/rclcpp.hpp>

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    int code = 1;
    {
        auto node = std::make_shared<rgbd_recorder::RecorderNode>();
        code = node->run();
    }
    rclcpp::shutdown();
    return code;
}
