#include "nmea0183_decoder/nmea_decoder_node.hpp"

//------------------------- Main -------------------------
int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    auto node = std::make_shared<nmea0183_decoder::NmeaDecoderNode>();
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
