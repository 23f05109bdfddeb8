#include "nmea0183_decoder/ros_conversions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nmea0183_decoder {

static constexpr double kKnotsToMs = 0.514444;

//------------------------- Fix status -------------------------
static int8_t navSatStatus(FixType type) {
    using sensor_msgs::msg::NavSatStatus;
    switch (type) {
    case FixType::Invalid: return NavSatStatus::STATUS_NO_FIX;
    case FixType::DGps: return NavSatStatus::STATUS_SBAS_FIX;
    case FixType::Rtk:
    case FixType::FloatRtk: return NavSatStatus::STATUS_GBAS_FIX;
    default: return NavSatStatus::STATUS_FIX;
    }
}

//------------------------- NavSatFix -------------------------
bool toNavSatFix(const GgaData &gga, sensor_msgs::msg::NavSatFix &fix) {
    if (!gga.latitude || !gga.longitude) return false;

    fix.latitude = *gga.latitude;
    fix.longitude = *gga.longitude;
    // NavSatFix altitude is above the WGS84 ellipsoid, GGA gives MSL + geoid separation.
    if (gga.altitude) {
        fix.altitude = static_cast<double>(*gga.altitude) + gga.geoid_height.value_or(0.0f);
    } else {
        fix.altitude = std::numeric_limits<double>::quiet_NaN();
    }

    fix.position_covariance.fill(0.0);
    if (gga.hdop) {
        double h = *gga.hdop;
        fix.position_covariance[0] = h * h;
        fix.position_covariance[4] = h * h;
        fix.position_covariance[8] = (2.0 * h) * (2.0 * h);
        fix.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_APPROXIMATED;
    } else {
        fix.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN;
    }

    fix.status.status = navSatStatus(gga.fix_type);
    fix.status.service = sensor_msgs::msg::NavSatStatus::SERVICE_GPS;
    return true;
}

bool toNavSatFix(const GllData &gll, sensor_msgs::msg::NavSatFix &fix) {
    fix.latitude = gll.latitude;
    fix.longitude = gll.longitude;
    fix.altitude = std::numeric_limits<double>::quiet_NaN();
    fix.position_covariance.fill(0.0);
    fix.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN;
    fix.status.status = sensor_msgs::msg::NavSatStatus::STATUS_FIX;
    fix.status.service = sensor_msgs::msg::NavSatStatus::SERVICE_GPS;
    return true;
}

//------------------------- TwistStamped -------------------------
static void fillTwist(double spd_kn, double cog_deg, geometry_msgs::msg::TwistStamped &twist) {
    double spd_ms = spd_kn * kKnotsToMs;
    double cog_rad = cog_deg * M_PI / 180.0;

    twist.twist.linear.x = spd_ms * std::cos(cog_rad);
    twist.twist.linear.y = spd_ms * std::sin(cog_rad);
    twist.twist.linear.z = 0.0;
}

bool toTwist(const RmcData &rmc, geometry_msgs::msg::TwistStamped &twist) {
    if (rmc.status_of_fix == RmcStatusOfFix::Invalid) return false;
    if (!rmc.speed_over_ground || !rmc.true_course) return false;
    fillTwist(*rmc.speed_over_ground, *rmc.true_course, twist);
    return true;
}

bool toTwist(const VtgData &vtg, geometry_msgs::msg::TwistStamped &twist) {
    if (!vtg.speed_over_ground || !vtg.true_course) return false;
    fillTwist(*vtg.speed_over_ground, *vtg.true_course, twist);
    return true;
}

//------------------------- nmea_msgs -------------------------
template <typename T>
static T clampTo(float v) {
    float lo = static_cast<float>(std::numeric_limits<T>::min());
    float hi = static_cast<float>(std::numeric_limits<T>::max());
    return static_cast<T>(std::min(std::max(v, lo), hi));
}

void toGpgsv(const GsvData &gsv, nmea_msgs::msg::Gpgsv &msg) {
    msg.n_msgs = static_cast<uint8_t>(std::min<uint16_t>(gsv.number_of_sentences, 255));
    msg.msg_number = static_cast<uint8_t>(std::min<uint16_t>(gsv.sentence_num, 255));
    msg.n_satellites = static_cast<uint8_t>(std::min<uint16_t>(gsv.sats_in_view, 255));

    msg.satellites.clear();
    for (const auto &slot : gsv.sats_info) {
        if (!slot) continue;
        nmea_msgs::msg::GpgsvSatellite sat;
        sat.prn = static_cast<uint8_t>(std::min<uint32_t>(slot->prn, 255));
        sat.elevation = clampTo<uint8_t>(slot->elevation.value_or(0.0f));
        sat.azimuth = clampTo<uint16_t>(slot->azimuth.value_or(0.0f));
        // -1 when not tracking
        sat.snr = slot->snr ? clampTo<int8_t>(*slot->snr) : static_cast<int8_t>(-1);
        msg.satellites.push_back(sat);
    }
}

void toGpgsa(const GsaData &gsa, nmea_msgs::msg::Gpgsa &msg) {
    msg.auto_manual_mode = gsa.mode1 == GsaMode1::Manual ? "M" : "A";
    switch (gsa.mode2) {
    case GsaMode2::NoFix: msg.fix_mode = 1; break;
    case GsaMode2::Fix2D: msg.fix_mode = 2; break;
    case GsaMode2::Fix3D: msg.fix_mode = 3; break;
    }

    msg.sv_ids.clear();
    for (uint32_t prn : gsa.fix_sats_prn) {
        if (prn <= 255) msg.sv_ids.push_back(static_cast<uint8_t>(prn));
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    msg.pdop = gsa.pdop.value_or(nan);
    msg.hdop = gsa.hdop.value_or(nan);
    msg.vdop = gsa.vdop.value_or(nan);
}

} // namespace nmea0183_decoder
