#pragma once

#include <rclcpp/rclcpp.hpp>
#include <nmea_msgs/msg/sentence.hpp>
#include <nmea_msgs/msg/gpgsa.hpp>
#include <nmea_msgs/msg/gpgsv.hpp>
#include <sensor_msgs/msg/nav_sat_fix.hpp>
#include <geometry_msgs/msg/twist_stamped.hpp>
#include <std_msgs/msg/header.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include "nmea_parser.hpp"

namespace nmea0183_decoder {

class NmeaDecoderNode : public rclcpp::Node {
public:
    explicit NmeaDecoderNode(const rclcpp::NodeOptions &options = rclcpp::NodeOptions());
    ~NmeaDecoderNode();

private:
    void readerThread();
    bool connectSocket();
    void closeSocket();
    void handleLine(const std::string &line);
    void publishDecoded(const ParseResult &result, const std_msgs::msg::Header &header,
                        const std::string &line);

    // Params
    std::string host_;
    int port_;
    std::string frame_id_;
    bool publish_fix_;
    bool publish_twist_;
    bool publish_satellites_;
    size_t max_line_length_;

    // Socket, closed only by the reader thread or after it is joined
    std::atomic<int> sockfd_{-1};
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Publishers
    rclcpp::Publisher<nmea_msgs::msg::Sentence>::SharedPtr nmea_pub_;
    rclcpp::Publisher<sensor_msgs::msg::NavSatFix>::SharedPtr fix_pub_;
    rclcpp::Publisher<geometry_msgs::msg::TwistStamped>::SharedPtr twist_pub_;
    rclcpp::Publisher<nmea_msgs::msg::Gpgsv>::SharedPtr gsv_pub_;
    rclcpp::Publisher<nmea_msgs::msg::Gpgsa>::SharedPtr gsa_pub_;

    // Parser
    NmeaParser parser_;

    // Stats, touched only by the reader thread until it is joined
    uint64_t decoded_count_{0};
    uint64_t unsupported_count_{0};
    std::array<uint64_t, 6> error_counts_{};
};

} // namespace nmea0183_decoder
