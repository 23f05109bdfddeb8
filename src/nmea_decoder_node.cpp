#include "nmea0183_decoder/nmea_decoder_node.hpp"
#include "nmea0183_decoder/ros_conversions.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#include <algorithm>

namespace nmea0183_decoder {

//------------------------- Constructor -------------------------
NmeaDecoderNode::NmeaDecoderNode(const rclcpp::NodeOptions &options)
: Node("nmea0183_decoder", options)
{
    host_ = this->declare_parameter<std::string>("tcp_host", "127.0.0.1");
    port_ = this->declare_parameter<int>("tcp_port", 52001);
    frame_id_ = this->declare_parameter<std::string>("frame_id", "gps");
    publish_fix_ = this->declare_parameter<bool>("publish_fix", true);
    publish_twist_ = this->declare_parameter<bool>("publish_twist", true);
    publish_satellites_ = this->declare_parameter<bool>("publish_satellites", false);
    int max_line = this->declare_parameter<int>("max_line_length", 4096);
    max_line_length_ = static_cast<size_t>(std::max(max_line, static_cast<int>(kMaxSentenceLength)));

    nmea_pub_ = this->create_publisher<nmea_msgs::msg::Sentence>("nmea_sentence", 100);
    if (publish_fix_) fix_pub_ = this->create_publisher<sensor_msgs::msg::NavSatFix>("fix", 10);
    if (publish_twist_) twist_pub_ = this->create_publisher<geometry_msgs::msg::TwistStamped>("ground_speed", 10);
    if (publish_satellites_) {
        gsv_pub_ = this->create_publisher<nmea_msgs::msg::Gpgsv>("gpgsv", 10);
        gsa_pub_ = this->create_publisher<nmea_msgs::msg::Gpgsa>("gpgsa", 10);
    }

    RCLCPP_INFO(get_logger(), "Decoding NMEA from %s:%d (frame_id '%s')",
                host_.c_str(), port_, frame_id_.c_str());

    running_.store(true);
    thread_ = std::thread(&NmeaDecoderNode::readerThread, this);
}

//------------------------- Destructor -------------------------
NmeaDecoderNode::~NmeaDecoderNode() {
    running_.store(false);
    // Unblock recv(); the reader thread notices running_ and exits.
    int fd = sockfd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    if (thread_.joinable()) thread_.join();
    closeSocket();

    uint64_t failed = 0;
    for (auto n : error_counts_) failed += n;
    RCLCPP_INFO(get_logger(), "Decoded %lu sentences, %lu unsupported, %lu rejected",
                static_cast<unsigned long>(decoded_count_),
                static_cast<unsigned long>(unsupported_count_),
                static_cast<unsigned long>(failed));
}

//------------------------- Socket -------------------------
bool NmeaDecoderNode::connectSocket() {
    closeSocket();
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    std::string port_str = std::to_string(port_);
    if (getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &res) != 0) {
        RCLCPP_WARN(get_logger(), "getaddrinfo failed for %s:%d", host_.c_str(), port_);
        return false;
    }

    int s = -1;
    for (auto p = res; p != nullptr; p = p->ai_next) {
        s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s == -1) continue;
        if (::connect(s, p->ai_addr, p->ai_addrlen) == 0) {
            sockfd_ = s;
            freeaddrinfo(res);
            RCLCPP_INFO(get_logger(), "Connected to %s:%d", host_.c_str(), port_);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 10000, "Cannot connect to %s:%d",
                         host_.c_str(), port_);
    return false;
}

void NmeaDecoderNode::closeSocket() {
    int fd = sockfd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

//------------------------- Reader Thread -------------------------
void NmeaDecoderNode::readerThread() {
    std::string buffer;
    buffer.reserve(4096);
    int reconnect_delay = 1;

    while (running_.load()) {
        if (sockfd_ < 0) {
            if (!connectSocket()) {
                rclcpp::sleep_for(std::chrono::seconds(reconnect_delay));
                reconnect_delay = std::min(reconnect_delay*2, 16);
                continue;
            }
            reconnect_delay = 1;
            buffer.clear();
            if (!running_.load()) break;
        }

        char temp[1024];
        ssize_t n = ::recv(sockfd_.load(), temp, sizeof(temp), 0);
        if (n <= 0) {
            if (running_.load()) RCLCPP_WARN(get_logger(), "Connection to %s:%d lost", host_.c_str(), port_);
            closeSocket();
            continue;
        }

        buffer.append(temp, temp+n);
        size_t pos = 0;

        while(true) {
            auto nl = buffer.find('\n', pos);
            if (nl == std::string::npos) {
                // A line longer than this never reached a newline; resync on the next one.
                if (buffer.size() - pos > max_line_length_) buffer.clear();
                else buffer.erase(0, pos);
                break;
            }

            std::string line = buffer.substr(pos, nl-pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pos = nl+1;
            if (line.empty()) continue;

            handleLine(line);
        }
    }
}

//------------------------- Line Handling -------------------------
void NmeaDecoderNode::handleLine(const std::string &line) {
    // Publish raw
    nmea_msgs::msg::Sentence sentence;
    sentence.header.stamp = this->now();
    sentence.header.frame_id = frame_id_;
    sentence.sentence = line;
    nmea_pub_->publish(sentence);

    try {
        ParseResult result = parser_.parse(line);
        publishDecoded(result, sentence.header, line);
    } catch (const ParseError &e) {
        error_counts_[static_cast<size_t>(e.kind())]++;
        switch (e.kind()) {
        case ErrorKind::Oversized:
        case ErrorKind::Malformed:
        case ErrorKind::ChecksumHex:
        case ErrorKind::ChecksumMismatch:
            RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "Dropped corrupted line (%s): %s",
                                 toString(e.kind()), e.what());
            break;
        default:
            RCLCPP_DEBUG(get_logger(), "Cannot decode '%s': %s", line.c_str(), e.what());
            break;
        }
    }
}

void NmeaDecoderNode::publishDecoded(const ParseResult &result, const std_msgs::msg::Header &header,
                                     const std::string &line) {
    if (auto *u = std::get_if<Unsupported>(&result)) {
        unsupported_count_++;
        RCLCPP_DEBUG(get_logger(), "Unsupported sentence type %s", u->message_id.c_str());
        return;
    }
    decoded_count_++;
    RCLCPP_DEBUG(get_logger(), "Decoded %s sentence", sentenceTypeName(result).c_str());

    if (auto *gga = std::get_if<GgaData>(&result)) {
        sensor_msgs::msg::NavSatFix fix;
        if (!publish_fix_) return;
        if (toNavSatFix(*gga, fix)) { fix.header = header; fix_pub_->publish(fix); }
        else RCLCPP_DEBUG(get_logger(), "GGA without position (fix quality %s)", toString(gga->fix_type));
    }
    else if (auto *gll = std::get_if<GllData>(&result)) {
        sensor_msgs::msg::NavSatFix fix;
        if (publish_fix_ && toNavSatFix(*gll, fix)) { fix.header = header; fix_pub_->publish(fix); }
    }
    else if (auto *rmc = std::get_if<RmcData>(&result)) {
        geometry_msgs::msg::TwistStamped tw;
        if (publish_twist_ && toTwist(*rmc, tw)) { tw.header = header; twist_pub_->publish(tw); }
    }
    else if (auto *vtg = std::get_if<VtgData>(&result)) {
        geometry_msgs::msg::TwistStamped tw;
        if (publish_twist_ && toTwist(*vtg, tw)) { tw.header = header; twist_pub_->publish(tw); }
    }
    else if (auto *gsv = std::get_if<GsvData>(&result)) {
        if (!publish_satellites_) return;
        RCLCPP_DEBUG(get_logger(), "%s GSV %u/%u, %u in view", toString(gsv->gnss_type),
                     static_cast<unsigned>(gsv->sentence_num), static_cast<unsigned>(gsv->number_of_sentences),
                     static_cast<unsigned>(gsv->sats_in_view));
        nmea_msgs::msg::Gpgsv msg;
        toGpgsv(*gsv, msg);
        msg.header = header;
        msg.message_id = line.substr(1, 5);
        gsv_pub_->publish(msg);
    }
    else if (auto *gsa = std::get_if<GsaData>(&result)) {
        if (!publish_satellites_) return;
        nmea_msgs::msg::Gpgsa msg;
        toGpgsa(*gsa, msg);
        msg.header = header;
        msg.message_id = line.substr(1, 5);
        gsa_pub_->publish(msg);
    }
}

} // namespace nmea0183_decoder
