/*
* @Author: BlahGeek
* @Date:   2016-06-02
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#ifndef LENSWARP_CAMERA_H
#define LENSWARP_CAMERA_H value

#if defined( _MSC_VER )
#define _USE_MATH_DEFINES
#endif
#include <cmath>
#include "rapidjson/document.h"
#include <memory>
#include <utility>
#include <exception>
#include <string>
#include "opencv2/core.hpp"

#include "lenswarp.hpp"

namespace lenswarp {

// x axis: image right
// y axis: image up
// z axis: optical axis of the photo, top pole of the panorama
// right-handed

// (0, 0, 1) is the photo center and the top row of the panorama
// (1, 0, 0) is lon 0, lat PI/2 (center column of the panorama)

// Pixel coordinates are continuous, pixel centers are at integers.

/**
 * Camera model
 */
class Camera {
protected:
    cv::Size size;

public:
    /**
     * Requires "width" and "height"
     */
    explicit Camera(const rapidjson::Value & options);
    virtual ~Camera() {}

    cv::Size get_size() const {
        return this->size;
    }

    /**
     * Whether the image is periodic in x, so that sampling should
     * wrap around the left/right edges instead of clamping
     */
    virtual bool is_periodic() const {
        return false;
    }

    /**
     * Map image point to a direction in sphere
     * @param  xy pixel coordinate
     * @return    unit vector, or NAN if the point sees nothing
     */
    virtual cv::Point3d image_to_obj_single(const cv::Point2d & xy) const = 0;

    /**
     * Map a direction in sphere to image point
     * @param  xyz unit vector
     * @return     pixel coordinate, or NAN if outside of view
     */
    virtual cv::Point2d obj_to_image_single(const cv::Point3d & xyz) const = 0;

public:
    static std::unique_ptr<Camera> New(const std::string & type, const rapidjson::Value & opts);
};

inline bool is_miss(const cv::Point2d & p) {
    return std::isnan(p.x) || std::isnan(p.y);
}

inline bool is_miss(const cv::Point3d & p) {
    return std::isnan(p.x) || std::isnan(p.y) || std::isnan(p.z);
}

/**
 * Option accessors, throw ConfigurationError naming the key
 */
int get_int_option(const rapidjson::Value & options, const char * key);
double get_double_option(const rapidjson::Value & options, const char * key);
std::string get_string_option(const rapidjson::Value & options, const char * key);
std::string get_string_option(const rapidjson::Value & options, const char * key,
                              const std::string & default_value);

}

#endif
