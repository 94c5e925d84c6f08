/*
* @Author: BlahGeek
* @Date:   2016-06-04
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-17
*/

#include "./equirectangular.hpp"
#include <algorithm>
#include <stdio.h>

using namespace lenswarp;

Equirectangular::Equirectangular(const rapidjson::Value & options): Camera(options) {
    fprintf(stderr, "Equirectangular, %dx%d\n", size.width, size.height);
    if(size.width != 2 * size.height)
        fprintf(stderr, "Warning: equirectangular image is not 2:1 (%dx%d), "
                        "pixels will not be square in angle\n",
                size.width, size.height);
}

cv::Point2d Equirectangular::direction_to_lonlat(const cv::Point3d & xyz) {
    double n = cv::norm(xyz);
    if(!(n > 0))
        return cv::Point2d(NAN, NAN);
    auto p = xyz * (1.0 / n);

    double lat = acos(std::max(-1.0, std::min(1.0, p.z)));
    // longitude is meaningless at the poles, use 0
    double lon = 0;
    if(p.x * p.x + p.y * p.y > 1e-24)
        lon = atan2(p.y, p.x);
    return cv::Point2d(lon, lat);
}

cv::Point3d Equirectangular::lonlat_to_direction(const cv::Point2d & lonlat) {
    auto lon = lonlat.x;
    auto lat = lonlat.y;
    return cv::Point3d(sin(lat) * cos(lon),
                       sin(lat) * sin(lon),
                       cos(lat));
}

cv::Point3d Equirectangular::image_to_obj_single(const cv::Point2d & xy) const {
    if(xy.y < -0.5 || xy.y > size.height - 0.5)
        return cv::Point3d(NAN, NAN, NAN);
    double lon = (xy.x + 0.5) / size.width * M_PI * 2.0 - M_PI;
    double lat = (xy.y + 0.5) / size.height * M_PI;
    return lonlat_to_direction(cv::Point2d(lon, lat));
}

cv::Point2d Equirectangular::obj_to_image_single(const cv::Point3d & xyz) const {
    auto lonlat = direction_to_lonlat(xyz);
    if(is_miss(lonlat))
        return lonlat;
    double x = (lonlat.x + M_PI) / (M_PI * 2.0) * size.width - 0.5;
    double y = lonlat.y / M_PI * size.height - 0.5;
    return cv::Point2d(x, y);
}
