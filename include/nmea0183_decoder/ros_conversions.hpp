#pragma once

#include <sensor_msgs/msg/nav_sat_fix.hpp>
#include <geometry_msgs/msg/twist_stamped.hpp>
#include <nmea_msgs/msg/gpgsa.hpp>
#include <nmea_msgs/msg/gpgsv.hpp>

#include "nmea0183_decoder/types.hpp"

namespace nmea0183_decoder {

// Converters fill message bodies only; header stamp and frame_id are left to
// the caller. They return false when the record has nothing to publish.

bool toNavSatFix(const GgaData &gga, sensor_msgs::msg::NavSatFix &fix);
bool toNavSatFix(const GllData &gll, sensor_msgs::msg::NavSatFix &fix);

// Ground velocity from speed (knots) and course over ground, x along cos(cog).
bool toTwist(const RmcData &rmc, geometry_msgs::msg::TwistStamped &twist);
bool toTwist(const VtgData &vtg, geometry_msgs::msg::TwistStamped &twist);

// Gpgsv has no "not reported" value for elevation and azimuth: an absent one
// is published as 0. An absent SNR is published as -1.
void toGpgsv(const GsvData &gsv, nmea_msgs::msg::Gpgsv &msg);

// sv_ids is uint8: PRNs above 255 (BeiDou, SBAS extensions) are left out of
// sv_ids. Absent DOPs are NaN.
void toGpgsa(const GsaData &gsa, nmea_msgs::msg::Gpgsa &msg);

} // namespace nmea0183_decoder
