/*
* @Author: BlahGeek
* @Date:   2016-06-04
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-17
*/

#ifndef LENSWARP_EQUIRECTANGULAR_H
#define LENSWARP_EQUIRECTANGULAR_H value

#include "../camera.hpp"

namespace lenswarp {

/**
 * Full sphere longitude / latitude grid
 * top row: lat 0 (+z), bottom row: lat PI (-z)
 * left edge: lon -PI, right edge: lon +PI, same meridian
 */
class Equirectangular: public Camera {
public:
    Equirectangular(const rapidjson::Value & options);

    bool is_periodic() const override {
        return true;
    }

    cv::Point3d image_to_obj_single(const cv::Point2d & xy) const override;
    cv::Point2d obj_to_image_single(const cv::Point3d & xyz) const override;

public:
    /**
     * @param  xyz direction, need not be normalized
     * @return     lon in (-PI, PI], lat in [0, PI]; lon is 0 at the poles
     */
    static cv::Point2d direction_to_lonlat(const cv::Point3d & xyz);
    static cv::Point3d lonlat_to_direction(const cv::Point2d & lonlat);
};

}

#endif
